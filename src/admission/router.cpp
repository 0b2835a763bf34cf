#include <boost/asio/post.hpp>
#include <boost/endian/conversion.hpp>
#include <spdlog/spdlog.h>
#include <covenant/admission/router.hpp>
#include <covenant/admission/security_filter.hpp>
#include <covenant/blake3/hash.hpp>
#include <covenant/common/critical.hpp>
#include <covenant/schema/encoding/scale/event_payloads.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <memory>
#include <system_error>
#include <thread>

using namespace covenant::schema;

namespace covenant::admission {

namespace {

routing_decision_t make_unavailable(routing_decision_t decision,
                                    const std::string_view detail) {
  spdlog::error("Admission failed closed: {}", detail);
  decision.tier = routing_tier_t::blocked;
  decision.reason = std::string{kLedgerUnavailableReason};
  decision.rejection.reset();
  decision.created_task_id.reset();
  return decision;
}

classification_t fallback(std::string reason) {
  spdlog::warn("Intent classifier fallback to LOW: {}", reason);
  return classification_t{.tier = routing_tier_t::low,
                          .reason = "classifier fallback: " + reason};
}

std::string short_id(const hash32_t& id) {
  return to_hex(bytes_view_t{id.data(), 8});
}

}  // namespace

request_id_t make_request_id(const std::string_view raw_input,
                             const timestamp_milliseconds_t arrived_at) {
  auto big = boost::endian::native_to_big(arrived_at);
  return covenant::blake3::hash(
      {make_bytes_view(raw_input),
       bytes_view_t{reinterpret_cast<const uint8_t*>(&big), sizeof(big)}});
}

task_id_t make_task_id(const request_id_t& request_id) {
  return covenant::blake3::hash(
      {bytes_view_t{request_id}, make_bytes_view(std::string_view{"task"})});
}

router::router(covenant::storage::rocksdb_storage_t& storage,
               covenant::ledger::ledger& ledger,
               covenant::scheduler::scheduler& scheduler,
               lazy_queue& lazy_queue,
               intent_classifier_t classifier,
               placement_ranker_t placement_ranker,
               covenant::common::clock_t clock,
               router_options options)
    : storage_{storage},
      ledger_{ledger},
      scheduler_{scheduler},
      lazy_queue_{lazy_queue},
      classifier_{std::move(classifier)},
      placement_ranker_{std::move(placement_ranker)},
      clock_{std::move(clock)},
      options_{options},
      admission_pool_{std::max<std::size_t>(options.admission_workers, 1)},
      classifications_in_flight_{std::make_shared<std::atomic<std::size_t>>(0)} {}

router::~router() {
  shutdown();
}

std::size_t router::load() {
  auto now = clock_();
  auto prefix = key::make_prefix(key::kRoutePrefix);
  auto expired = covenant::storage::write_batch{};
  auto kept = std::vector<std::pair<timestamp_milliseconds_t, hash32_t>>{};

  auto lock = std::scoped_lock{idempotency_mutex_};
  index_.clear();
  expiry_.clear();
  for (const auto& [row_key, row_value] : storage_.list_by_prefix(prefix)) {
    auto decision = encoding::scale::try_decode_routing_decision(row_value);
    if (!decision || row_key.size() != prefix.size() + sizeof(hash32_t)) {
      covenant::common::critical("undecodable route row at key {}",
                                 to_hex(row_key));
    }
    if (now > decision->arrived_at &&
        now - decision->arrived_at > options_.idempotency_window) {
      expired.erase(row_key);
      continue;
    }
    auto input_hash = hash32_t{};
    std::copy_n(std::begin(row_key) + prefix.size(), input_hash.size(),
                std::begin(input_hash));
    auto ready = std::promise<routing_decision_t>{};
    ready.set_value(*decision);
    index_.insert_or_assign(
        input_hash, idempotency_entry{.recorded_at = decision->arrived_at,
                                      .decision = ready.get_future().share()});
    kept.emplace_back(decision->arrived_at, input_hash);
  }
  std::ranges::sort(kept);
  expiry_.assign(std::begin(kept), std::end(kept));

  if (!expired.empty()) {
    auto status = storage_.commit(expired, false);
    if (!status.ok) {
      spdlog::warn("Could not delete expired route rows: {}", status.error);
    }
  }
  spdlog::info("Idempotency index rebuilt: {} decision(s) kept, {} expired",
               index_.size(), expired.deletes.size());
  return index_.size();
}

void router::prune(const timestamp_milliseconds_t now) {
  auto expired = covenant::storage::write_batch{};
  while (!expiry_.empty() &&
         now - std::min(now, expiry_.front().first) >
             options_.idempotency_window) {
    auto found = index_.find(expiry_.front().second);
    if (found != std::end(index_) &&
        found->second.recorded_at == expiry_.front().first) {
      index_.erase(found);
      expired.erase(key::make_route_key(expiry_.front().second));
    }
    expiry_.pop_front();
  }
  if (expired.empty()) {
    return;
  }
  // Under the index lock so a fresh decision for the same input cannot be
  // written before the stale row is gone.
  auto status = storage_.commit(expired, false);
  if (!status.ok) {
    spdlog::warn("Could not delete {} expired route row(s): {}",
                 expired.deletes.size(), status.error);
  }
}

void router::forget(const hash32_t& input_hash,
                    const timestamp_milliseconds_t recorded_at) {
  auto lock = std::scoped_lock{idempotency_mutex_};
  auto found = index_.find(input_hash);
  if (found != std::end(index_) && found->second.recorded_at == recorded_at) {
    index_.erase(found);
  }
}

routing_decision_t router::admit(const std::string_view raw_input,
                                 const agent_id_t& source_agent_id) {
  auto now = clock_();
  if (ledger_.halted()) {
    return make_unavailable(
        routing_decision_t{.request_id = make_request_id(raw_input, now),
                           .source_agent_id = source_agent_id,
                           .arrived_at = now},
        ledger_.halt_reason());
  }

  auto input_hash = covenant::blake3::hash(raw_input);
  auto promise = std::promise<routing_decision_t>{};
  auto first = std::shared_future<routing_decision_t>{};
  {
    auto lock = std::scoped_lock{idempotency_mutex_};
    prune(now);
    auto found = index_.find(input_hash);
    if (found != std::end(index_)) {
      first = found->second.decision;
    } else {
      index_.insert_or_assign(
          input_hash, idempotency_entry{.recorded_at = now,
                                        .decision = promise.get_future().share()});
      expiry_.emplace_back(now, input_hash);
    }
  }
  if (first.valid()) {
    spdlog::debug("Duplicate request {} answered from the idempotency index",
                  short_id(input_hash));
    return first.get();
  }

  auto decision = routing_decision_t{};
  try {
    decision = decide(raw_input, source_agent_id, input_hash);
  } catch (...) {
    // Waiting duplicates see the same failure; the next attempt starts over.
    forget(input_hash, now);
    promise.set_exception(std::current_exception());
    throw;
  }
  if (decision.reason == kLedgerUnavailableReason) {
    // Fail-closed answers are not remembered; a retry after recovery is new.
    forget(input_hash, now);
  }
  promise.set_value(decision);
  return decision;
}

std::future<routing_decision_t> router::submit(std::string raw_input,
                                               agent_id_t source_agent_id) {
  auto promise = std::make_shared<std::promise<routing_decision_t>>();
  auto result = promise->get_future();
  submit(std::move(raw_input), std::move(source_agent_id),
         [promise](std::exception_ptr error, routing_decision_t decision) {
           if (error) {
             promise->set_exception(error);
           } else {
             promise->set_value(std::move(decision));
           }
         });
  return result;
}

void router::submit(std::string raw_input,
                    agent_id_t source_agent_id,
                    admission_handler_t handler) {
  if (stopped_.load()) {
    handler(nullptr, make_unavailable(routing_decision_t{.arrived_at = clock_()},
                                      "router is shut down"));
    return;
  }
  boost::asio::post(
      admission_pool_,
      [this, raw_input = std::move(raw_input),
       source_agent_id = std::move(source_agent_id),
       handler = std::move(handler)]() {
        auto decision = routing_decision_t{};
        try {
          decision = admit(raw_input, source_agent_id);
        } catch (...) {
          spdlog::error("Admission of a request from '{}' failed",
                        source_agent_id);
          handler(std::current_exception(), routing_decision_t{});
          return;
        }
        handler(nullptr, std::move(decision));
      });
}

void router::shutdown() {
  if (stopped_.exchange(true)) {
    return;
  }
  admission_pool_.join();
  if (auto running = classifications_in_flight_->load(); running > 0) {
    spdlog::warn("Admission router stopped with {} classification(s) still "
                 "running",
                 running);
    return;
  }
  spdlog::info("Admission router stopped");
}

classification_t router::classify(const std::string_view raw_input) {
  if (!classifier_) {
    return fallback("no classifier installed");
  }
  auto in_flight = classifications_in_flight_;
  if (in_flight->fetch_add(1) >=
      std::max<std::size_t>(options_.classifier_workers, 1)) {
    in_flight->fetch_sub(1);
    return fallback("classifier saturated");
  }
  auto job = std::make_shared<std::packaged_task<classification_t()>>(
      [classifier = classifier_, input = std::string{raw_input}]() {
        return classifier(input);
      });
  auto result = job->get_future();
  try {
    std::thread{[job, in_flight]() {
      (*job)();
      in_flight->fetch_sub(1);
    }}.detach();
  } catch (const std::system_error& e) {
    in_flight->fetch_sub(1);
    return fallback(std::string{"classifier thread: "} + e.what());
  }

  if (result.wait_for(std::chrono::milliseconds{options_.classifier_timeout}) !=
      std::future_status::ready) {
    return fallback("timeout");
  }
  try {
    auto classification = result.get();
    if (classification.tier == routing_tier_t::blocked) {
      return fallback("classifier answered BLOCKED");
    }
    return classification;
  } catch (const std::exception& e) {
    return fallback(std::string{"classifier threw: "} + e.what());
  }
}

bytes_t router::rank(const task_spec_t& spec) {
  if (!placement_ranker_) {
    return {};
  }
  try {
    return placement_ranker_(spec);
  } catch (const std::exception& e) {
    spdlog::warn("Placement ranker failed for request {}, using empty rank: {}",
                 short_id(spec.request_id), e.what());
    return {};
  }
}

routing_decision_t router::decide(const std::string_view raw_input,
                                  const agent_id_t& source_agent_id,
                                  const hash32_t& input_hash) {
  auto now = clock_();
  auto decision = routing_decision_t{.request_id = make_request_id(raw_input, now),
                                     .source_agent_id = source_agent_id,
                                     .arrived_at = now};

  if (auto reason = inspect(raw_input, options_.max_input_bytes)) {
    return block(std::move(decision), std::string{*reason},
                 security_rejection_t::malicious_input, input_hash);
  }

  auto classification = classify(raw_input);
  decision.tier = classification.tier;
  decision.reason = std::move(classification.reason);
  decision.concepts = std::move(classification.concepts);

  if (decision.tier == routing_tier_t::low) {
    switch (lazy_queue_.try_reserve(make_task_id(decision.request_id),
                                    decision.request_id)) {
      case reserve_result::saturated:
        return block(std::move(decision), std::string{kQueueSaturatedReason},
                     security_rejection_t::queue_saturated, input_hash);
      case reserve_result::unavailable:
        return make_unavailable(std::move(decision),
                                "lazy queue slot could not be persisted");
      case reserve_result::reserved:
        break;
    }
  }
  return accept(std::move(decision), raw_input, input_hash);
}

routing_decision_t router::block(routing_decision_t decision,
                                 std::string reason,
                                 std::optional<security_rejection_t> rejection,
                                 const hash32_t& input_hash) {
  decision.tier = routing_tier_t::blocked;
  decision.reason = std::move(reason);
  decision.rejection = rejection;
  decision.created_task_id.reset();

  auto batch = covenant::storage::write_batch{};
  batch.put(key::make_route_key(input_hash), encoding::scale::encode_row(decision));
  auto appended = ledger_.append(
      ledger_event_type_t::request_blocked,
      encoding::scale::make_request_payload(decision),
      decision.source_agent_id.empty() ? kSystemActor
                                       : std::string_view{decision.source_agent_id},
      batch);
  if (appended.code != 0) {
    return make_unavailable(std::move(decision), appended.log);
  }
  spdlog::info("Request {} from '{}' blocked: {}", short_id(decision.request_id),
               decision.source_agent_id, decision.reason);
  return decision;
}

routing_decision_t router::accept(routing_decision_t decision,
                                  const std::string_view raw_input,
                                  const hash32_t& input_hash) {
  auto task_id = make_task_id(decision.request_id);
  auto release_slot = [&]() {
    if (decision.tier == routing_tier_t::low) {
      lazy_queue_.release(task_id);
    }
  };
  decision.created_task_id = task_id;

  auto spec = task_spec_t{.task_id = task_id,
                          .request_id = decision.request_id,
                          .payload = make_bytes(raw_input),
                          .routing_tier = decision.tier,
                          .max_retries = options_.max_retries};
  try {
    spec.placement_rank = rank(spec);
  } catch (...) {
    release_slot();
    throw;
  }

  auto appended = ledger_.append(
      ledger_event_type_t::request_admitted,
      encoding::scale::make_request_payload(decision),
      decision.source_agent_id.empty() ? kSystemActor
                                       : std::string_view{decision.source_agent_id});
  if (appended.code != 0) {
    release_slot();
    return make_unavailable(std::move(decision), appended.log);
  }

  // The route row lands with the task, so a restart never sees one without
  // the other.
  auto route = covenant::storage::write_batch{};
  route.put(key::make_route_key(input_hash), encoding::scale::encode_row(decision));
  auto created = scheduler_.create_task(spec, route);
  if (created.code != 0) {
    release_slot();
    return make_unavailable(std::move(decision), created.log);
  }

  spdlog::info("Request {} from '{}' admitted at {} as task {}",
               short_id(decision.request_id), decision.source_agent_id,
               to_string(decision.tier), short_id(task_id));
  return decision;
}

}  // namespace covenant::admission
