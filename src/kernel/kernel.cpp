#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/crypto/verify.hpp>
#include <covenant/kernel/kernel.hpp>

#include <chrono>
#include <utility>

using namespace covenant::schema;

namespace covenant::kernel {

namespace {

template <typename T>
T& require(const std::unique_ptr<T>& component, const std::string_view name) {
  if (!component) {
    covenant::common::critical("kernel component '{}' used before init()",
                               name);
  }
  return *component;
}

bool fail_phase(boot_result_t& result,
                const std::string_view phase,
                std::string reason) {
  spdlog::critical("Boot phase '{}' failed: {}", phase, reason);
  result.code = 1;
  result.failed_phase = std::string{phase};
  result.log = std::move(reason);
  return false;
}

void complete_phase(boot_result_t& result, const std::string_view phase) {
  ++result.phases_completed;
  spdlog::info("Boot phase '{}' complete ({})", phase, result.phases_completed);
}

}  // namespace

kernel::kernel(kernel_config config, collaborators collaborators)
    : config_{std::move(config)}, collaborators_{std::move(collaborators)} {
  capabilities_.custom_signature_verifier =
      static_cast<bool>(collaborators_.signature_verifier);
  capabilities_.strict_crypto =
      capabilities_.custom_signature_verifier || covenant::crypto::available();
  capabilities_.custom_classifier =
      static_cast<bool>(collaborators_.intent_classifier);
  capabilities_.custom_placement_ranker =
      static_cast<bool>(collaborators_.placement_ranker);

  if (!collaborators_.clock) {
    collaborators_.clock = covenant::common::system_clock_milliseconds;
  }
  if (!collaborators_.policy_provider) {
    collaborators_.policy_provider =
        config_.policy_path.empty()
            ? covenant::governance::make_static_policy_provider(
                  make_bytes(covenant::governance::kGenesisPolicy))
            : covenant::governance::make_file_policy_provider(
                  config_.policy_path);
  }
  if (!collaborators_.signature_verifier) {
    collaborators_.signature_verifier =
        covenant::governance::make_openssl_signature_verifier();
  }
  if (!collaborators_.intent_classifier) {
    collaborators_.intent_classifier =
        covenant::admission::make_heuristic_classifier();
  }

  spdlog::info(
      "Kernel capabilities: strict_crypto={}, custom_verifier={}, "
      "custom_classifier={}, custom_placement_ranker={}",
      capabilities_.strict_crypto, capabilities_.custom_signature_verifier,
      capabilities_.custom_classifier, capabilities_.custom_placement_ranker);
}

kernel::~kernel() {
  shutdown();
}

boot_result_t kernel::init() {
  auto result = boot_result_t{};
  {
    auto lock = std::scoped_lock{state_mutex_};
    if (running_ || storage_) {
      result.code = 1;
      result.failed_phase = "init";
      result.log = "kernel already initialized";
      return result;
    }
  }

  auto ok = open_storage(result) && open_ledger(result) &&
            load_agents(result) && load_tasks(result) &&
            start_router(result) && register_bootstrap_agents(result) &&
            start_reaper(result);
  if (!ok) {
    shutdown();
    return result;
  }
  spdlog::info("Kernel ready, {} boot phase(s) complete",
               result.phases_completed);
  return result;
}

bool kernel::open_storage(boot_result_t& result) {
  auto error = std::string{};
  auto store =
      covenant::storage::try_make_storage(config_.database_path.string(), error);
  if (!store) {
    return fail_phase(result, "storage", error);
  }
  storage_ = std::make_unique<covenant::storage::rocksdb_storage_t>(
      std::move(*store));
  complete_phase(result, "storage");
  return true;
}

bool kernel::open_ledger(boot_result_t& result) {
  ledger_ = std::make_unique<covenant::ledger::ledger>(
      *storage_, collaborators_.clock, config_.ledger);
  if (!ledger_->recover()) {
    return fail_phase(result, "ledger", ledger_->halt_reason());
  }
  auto verification = ledger_->verify_chain_integrity();
  if (verification.code != 0) {
    return fail_phase(result, "ledger", verification.log);
  }
  complete_phase(result, "ledger");
  return true;
}

bool kernel::load_agents(boot_result_t& result) {
  gate_ = std::make_unique<covenant::governance::gate>(
      *storage_, *ledger_, collaborators_.policy_provider,
      collaborators_.signature_verifier, collaborators_.clock);
  gate_->load();
  complete_phase(result, "agents");
  return true;
}

bool kernel::load_tasks(boot_result_t& result) {
  lazy_queue_ = std::make_unique<covenant::admission::lazy_queue>(
      *storage_, config_.lazy_queue_capacity, collaborators_.clock);
  lazy_queue_->load();

  auto* gate = gate_.get();
  scheduler_ = std::make_unique<covenant::scheduler::scheduler>(
      *storage_, *ledger_,
      [gate](const std::string_view agent_id) {
        return gate->is_sworn(agent_id);
      },
      collaborators_.clock, config_.scheduler);
  scheduler_->load();

  auto* backlog = lazy_queue_.get();
  scheduler_->set_terminal_listener([backlog](const task_t& task) {
    if (task.routing_tier == routing_tier_t::low) {
      backlog->release(task.task_id);
    }
  });
  scheduler_->set_lazy_queue_probe([backlog]() {
    return std::pair<uint64_t, uint64_t>{backlog->depth(), backlog->capacity()};
  });

  // A crash between slot reservation and task creation, or between a
  // terminal transition and the release, leaves a slot with no live task.
  auto released = std::size_t{};
  for (const auto& task_id : lazy_queue_->entries()) {
    auto task = scheduler_->find_task(task_id);
    if (!task || is_terminal(task->status)) {
      lazy_queue_->release(task_id);
      ++released;
    }
  }
  if (released > 0) {
    spdlog::warn("Released {} orphaned lazy queue slot(s)", released);
  }
  complete_phase(result, "tasks");
  return true;
}

bool kernel::start_router(boot_result_t& result) {
  router_ = std::make_unique<covenant::admission::router>(
      *storage_, *ledger_, *scheduler_, *lazy_queue_,
      collaborators_.intent_classifier, collaborators_.placement_ranker,
      collaborators_.clock, config_.router);
  router_->load();
  {
    auto lock = std::scoped_lock{state_mutex_};
    running_ = true;
    stopping_ = false;
  }
  complete_phase(result, "router");
  return true;
}

bool kernel::register_bootstrap_agents(boot_result_t& result) {
  for (const auto& agent : config_.bootstrap_agents) {
    auto registration =
        gate_->register_agent(agent.agent_id, agent.public_key,
                              agent.capabilities, agent.oath_signature);
    if (registration.code == 0) {
      continue;
    }
    if (registration.code ==
        static_cast<uint32_t>(governance_error_code::already_registered)) {
      auto existing = gate_->find_agent(agent.agent_id);
      if (existing &&
          signer_bytes(existing->public_key) == signer_bytes(agent.public_key)) {
        spdlog::info("Bootstrap agent '{}' already sworn", agent.agent_id);
        continue;
      }
    }
    return fail_phase(result, "bootstrap",
                      "agent '" + agent.agent_id + "': " + registration.log);
  }
  complete_phase(result, "bootstrap");
  return true;
}

bool kernel::start_reaper(boot_result_t& result) {
  if (config_.reaper_interval > 0) {
    reaper_ = std::thread{[this]() { reap_loop(); }};
  } else {
    spdlog::warn("Reaper disabled; claims and deadlines will not expire");
  }
  complete_phase(result, "reaper");
  return true;
}

void kernel::reap_loop() {
  auto interval = std::chrono::milliseconds{config_.reaper_interval};
  auto lock = std::unique_lock{state_mutex_};
  while (!reaper_wakeup_.wait_for(lock, interval,
                                  [this]() { return stopping_; })) {
    lock.unlock();
    auto touched = scheduler_->reap_expired();
    if (touched > 0) {
      spdlog::debug("Reaper touched {} task(s)", touched);
    }
    lock.lock();
  }
}

void kernel::shutdown() {
  {
    auto lock = std::scoped_lock{state_mutex_};
    if (stopping_) {
      return;
    }
    stopping_ = true;
  }
  reaper_wakeup_.notify_all();
  if (reaper_.joinable()) {
    reaper_.join();
  }
  if (router_) {
    router_->shutdown();
  }
  {
    auto lock = std::scoped_lock{state_mutex_};
    if (running_) {
      spdlog::info("Kernel stopped");
    }
    running_ = false;
  }
}

bool kernel::running() const {
  auto lock = std::scoped_lock{state_mutex_};
  return running_;
}

bool kernel::healthy() const {
  return running() && ledger_ && !ledger_->halted();
}

covenant::governance::gate& kernel::governance() {
  return require(gate_, "governance gate");
}

covenant::admission::router& kernel::admission() {
  return require(router_, "admission router");
}

covenant::admission::lazy_queue& kernel::backlog() {
  return require(lazy_queue_, "lazy queue");
}

covenant::scheduler::scheduler& kernel::tasks() {
  return require(scheduler_, "scheduler");
}

covenant::ledger::ledger& kernel::events() {
  return require(ledger_, "ledger");
}

agent_handle kernel::make_agent_handle(agent_id_t agent_id) {
  auto* scheduler = &tasks();
  auto* router = &admission();
  return agent_handle{
      std::move(agent_id),
      agent_handle::callbacks{
          .next_task =
              [scheduler](const agent_id_t& id) {
                return scheduler->get_next_task(id);
              },
          .start =
              [scheduler](const task_id_t& task_id, const agent_id_t& id) {
                return scheduler->start_task(task_id, id);
              },
          .report =
              [scheduler](const task_id_t& task_id, const agent_id_t& id,
                          const task_outcome_t outcome, bytes_t payload) {
                return scheduler->report_task_result(task_id, id, outcome,
                                                     std::move(payload));
              },
          .submit =
              [router](std::string raw_input, const agent_id_t& id) {
                return router->submit(std::move(raw_input), id);
              }}};
}

queue_status_t kernel::queue_status() const {
  if (!scheduler_) {
    return queue_status_t{.degraded = true,
                          .degraded_reason = "kernel not initialized"};
  }
  return scheduler_->queue_status();
}

}  // namespace covenant::kernel
