#include <spdlog/spdlog.h>
#include <covenant/blake3/hash.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

using namespace covenant::schema;

namespace covenant::ledger {

hash32_t compute_event_hash(const ledger_event_t& event) {
  auto canonical = encoding::scale::canonical_bytes(event);
  return covenant::blake3::hash(
      {bytes_view_t{event.prev_hash}, bytes_view_t{canonical}});
}

ledger::ledger(covenant::storage::rocksdb_storage_t& storage,
               covenant::common::clock_t clock,
               ledger_options options)
    : storage_{storage}, clock_{std::move(clock)}, options_{options} {}

bool ledger::recover() {
  auto lock = std::scoped_lock{append_mutex_};
  auto prefix = key::make_prefix(key::kLedgerEventPrefix);
  auto raw_head = storage_.get(key::make_ledger_head_key());
  if (!raw_head) {
    if (!storage_.list_range(prefix, prefix, 1).empty()) {
      halt("ledger rows present without a head pointer");
      return false;
    }
    spdlog::info("Ledger is empty; genesis event will link to the zero hash");
    return true;
  }

  auto recovered = encoding::scale::try_decode_ledger_head(*raw_head);
  if (!recovered) {
    halt("ledger head pointer is undecodable");
    return false;
  }
  auto raw_last = storage_.get(key::make_ledger_event_key(recovered->sequence_number));
  if (!raw_last) {
    halt(fmt::format("ledger head points at missing sequence {}",
                     recovered->sequence_number));
    return false;
  }
  auto last = encoding::scale::try_decode_ledger_event(*raw_last);
  if (!last || last->hash != recovered->hash ||
      last->sequence_number != recovered->sequence_number) {
    halt(fmt::format("ledger head disagrees with row {}",
                     recovered->sequence_number));
    return false;
  }
  auto beyond = storage_.list_range(
      prefix, key::make_ledger_event_key(recovered->sequence_number + 1), 1);
  if (!beyond.empty()) {
    halt(fmt::format("ledger rows found beyond head sequence {}",
                     recovered->sequence_number));
    return false;
  }

  {
    auto head_lock = std::unique_lock{head_mutex_};
    head_ = *recovered;
  }
  spdlog::info("Recovered ledger head at sequence {} ({})",
               recovered->sequence_number, to_hex(recovered->hash));
  return true;
}

append_result_t ledger::append(const ledger_event_type_t event_type,
                               bytes_t payload,
                               const std::string_view actor,
                               const covenant::storage::write_batch& state_writes) {
  return append(event_type, std::move(payload), actor,
                [&](uint64_t) { return state_writes; });
}

append_result_t ledger::append(const ledger_event_type_t event_type,
                               bytes_t payload,
                               const std::string_view actor,
                               const state_writes_builder_t& build_state_writes) {
  auto lock = std::scoped_lock{append_mutex_};
  if (halted()) {
    return append_result_t{
        .code = static_cast<uint32_t>(ledger_error_code::halted),
        .log = halt_reason(),
        .codespace = std::string{kLedgerCodespace}};
  }

  auto current = head();
  auto event = ledger_event_t{
      .sequence_number = current.count == 0 ? 0 : current.sequence_number + 1,
      .prev_hash = current.count == 0 ? make_zero_hash() : current.hash,
      .event_type = event_type,
      .payload = std::move(payload),
      .timestamp = clock_(),
      .actor = std::string{actor}};
  event.hash = compute_event_hash(event);

  auto next_head = ledger_head{.sequence_number = event.sequence_number,
                               .hash = event.hash,
                               .count = current.count + 1};
  auto batch = build_state_writes ? build_state_writes(event.sequence_number)
                                  : covenant::storage::write_batch{};
  batch.put(key::make_ledger_event_key(event.sequence_number),
            encoding::scale::encode_row(event));
  batch.put(key::make_ledger_head_key(), encoding::scale::encode_row(next_head));

  auto status = commit_with_retry(batch);
  if (!status.ok) {
    halt(fmt::format("persistence failed at sequence {}: {}",
                     event.sequence_number, status.error));
    return append_result_t{
        .code = static_cast<uint32_t>(ledger_error_code::persistence_failed),
        .log = status.error,
        .codespace = std::string{kLedgerCodespace}};
  }

  {
    auto head_lock = std::unique_lock{head_mutex_};
    head_ = next_head;
  }
  spdlog::debug("Ledger appended {} at sequence {} by {}",
                to_string(event_type), event.sequence_number, event.actor);
  return append_result_t{.sequence_number = event.sequence_number,
                         .hash = event.hash};
}

chain_verification_result_t ledger::verify_chain_integrity() {
  auto result = chain_verification_result_t{
      .codespace = std::string{kLedgerCodespace}};
  auto fail = [&](const uint64_t sequence, std::string reason) {
    result.code = static_cast<uint32_t>(ledger_error_code::corrupted);
    result.valid = false;
    result.failed_sequence = sequence;
    result.log = reason;
    halt(fmt::format("chain verification failed at sequence {}: {}", sequence,
                     reason));
    return result;
  };

  // Appends keep running; rows past this head are not looked at.
  auto current = head();
  if (current.count == 0) {
    result.valid = true;
    return result;
  }
  auto prefix = key::make_prefix(key::kLedgerEventPrefix);
  auto expected = uint64_t{0};
  auto prev_hash = make_zero_hash();
  while (expected <= current.sequence_number) {
    auto remaining =
        static_cast<std::size_t>(current.sequence_number - expected + 1);
    auto rows = storage_.list_range(prefix, key::make_ledger_event_key(expected),
                                    std::min(remaining, options_.cursor_page_size));
    if (rows.empty()) {
      break;
    }
    for (const auto& [row_key, row_value] : rows) {
      auto sequence = key::try_parse_ledger_event_key(row_key);
      if (!sequence) {
        return fail(expected, "malformed ledger key");
      }
      if (*sequence != expected) {
        return fail(expected, fmt::format("sequence gap: found {}", *sequence));
      }
      auto event = encoding::scale::try_decode_ledger_event(row_value);
      if (!event) {
        return fail(*sequence, "undecodable event row");
      }
      if (event->sequence_number != *sequence) {
        return fail(*sequence, "row sequence disagrees with its key");
      }
      if (event->prev_hash != prev_hash) {
        return fail(*sequence, "prev_hash does not link to previous event");
      }
      if (compute_event_hash(*event) != event->hash) {
        return fail(*sequence, "stored hash does not match recomputed hash");
      }
      prev_hash = event->hash;
      ++expected;
      ++result.events_checked;
    }
  }

  if (expected != current.count) {
    return fail(expected, "chain ends before published head");
  }
  if (prev_hash != current.hash) {
    return fail(current.sequence_number, "head hash disagrees with last event");
  }
  result.valid = true;
  spdlog::info("Ledger chain verified: {} event(s)", result.events_checked);
  return result;
}

event_cursor ledger::events_since(const uint64_t sequence_number) {
  auto current = head();
  auto last = std::optional<uint64_t>{};
  if (current.count > 0) {
    last = current.sequence_number;
  }
  return event_cursor{storage_, sequence_number, last,
                      options_.cursor_page_size,
                      [this](const uint64_t sequence, const std::string& reason) {
                        halt(fmt::format("event cursor failed at sequence {}: {}",
                                         sequence, reason));
                      }};
}

ledger_head ledger::head() const {
  auto lock = std::shared_lock{head_mutex_};
  return head_;
}

std::optional<ledger_event_t> ledger::find(const uint64_t sequence_number) const {
  auto current = head();
  if (current.count == 0 || sequence_number > current.sequence_number) {
    return std::nullopt;
  }
  auto raw = storage_.get(key::make_ledger_event_key(sequence_number));
  if (!raw) {
    return std::nullopt;
  }
  return encoding::scale::try_decode_ledger_event(*raw);
}

bool ledger::halted() const {
  return halted_.load();
}

std::string ledger::halt_reason() const {
  auto lock = std::shared_lock{head_mutex_};
  return halt_reason_;
}

void ledger::halt(std::string reason) {
  {
    auto lock = std::unique_lock{head_mutex_};
    if (halted_.load()) {
      return;
    }
    halt_reason_ = std::move(reason);
    halted_.store(true);
  }
  spdlog::critical("Ledger halted: {}", halt_reason());
}

covenant::storage::write_status ledger::commit_with_retry(
    const covenant::storage::write_batch& batch) {
  auto backoff = std::chrono::milliseconds{options_.persistence_backoff};
  auto attempts = std::max<uint32_t>(options_.persistence_retry_attempts, 1);
  auto status = covenant::storage::write_status{};
  for (auto attempt = uint32_t{1}; attempt <= attempts; ++attempt) {
    status = storage_.commit(batch, true);
    if (status.ok) {
      return status;
    }
    spdlog::warn("Ledger write attempt {}/{} failed: {}", attempt, attempts,
                 status.error);
    if (attempt < attempts) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
  return status;
}

}  // namespace covenant::ledger
