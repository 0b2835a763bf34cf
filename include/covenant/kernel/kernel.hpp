#pragma once

#include <covenant/admission/intent_classifier.hpp>
#include <covenant/admission/lazy_queue.hpp>
#include <covenant/admission/router.hpp>
#include <covenant/common/clock.hpp>
#include <covenant/governance/gate.hpp>
#include <covenant/governance/policy_provider.hpp>
#include <covenant/governance/signature_verifier.hpp>
#include <covenant/kernel/agent_handle.hpp>
#include <covenant/kernel/config.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/scheduler/scheduler.hpp>
#include <covenant/schema/boot_result.hpp>
#include <covenant/schema/queue_status.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace covenant::kernel {

/// Injected behaviour. Every member may be left empty to get the bundled
/// default.
struct collaborators final {
  /// Default: file provider over kernel_config::policy_path, or the genesis
  /// policy when no path is configured.
  covenant::governance::policy_provider_t policy_provider;
  /// Default: OpenSSL ed25519/secp256k1.
  covenant::governance::signature_verifier_t signature_verifier;
  /// Default: keyword heuristic.
  covenant::admission::intent_classifier_t intent_classifier;
  /// Default: empty rank for every task.
  covenant::admission::placement_ranker_t placement_ranker;
  /// Default: system clock.
  covenant::common::clock_t clock;
};

/// Resolved once at construction.
struct kernel_capabilities final {
  bool strict_crypto{};
  bool custom_signature_verifier{};
  bool custom_classifier{};
  bool custom_placement_ranker{};
};

/// Owner of every component.
///
/// Components are created by init() in dependency order and torn down in
/// reverse. Accessors are only valid after a successful init().
class kernel final {
 public:
  explicit kernel(kernel_config config, collaborators collaborators = {});
  ~kernel();

  kernel(const kernel&) = delete;
  kernel& operator=(const kernel&) = delete;

  /// Phased boot. Stops at the first failing phase and names it.
  covenant::schema::boot_result_t init();

  /// Stop the reaper and drain the admission pool. Idempotent.
  void shutdown();

  bool running() const;

  /// Running with a ledger that still accepts appends.
  bool healthy() const;

  const kernel_capabilities& capabilities() const { return capabilities_; }
  const kernel_config& config() const { return config_; }

  covenant::governance::gate& governance();
  covenant::admission::router& admission();
  covenant::admission::lazy_queue& backlog();
  covenant::scheduler::scheduler& tasks();
  covenant::ledger::ledger& events();

  agent_handle make_agent_handle(covenant::schema::agent_id_t agent_id);

  covenant::schema::queue_status_t queue_status() const;

 private:
  bool open_storage(covenant::schema::boot_result_t& result);
  bool open_ledger(covenant::schema::boot_result_t& result);
  bool load_agents(covenant::schema::boot_result_t& result);
  bool load_tasks(covenant::schema::boot_result_t& result);
  bool start_router(covenant::schema::boot_result_t& result);
  bool register_bootstrap_agents(covenant::schema::boot_result_t& result);
  bool start_reaper(covenant::schema::boot_result_t& result);

  void reap_loop();

  kernel_config config_;
  collaborators collaborators_;
  kernel_capabilities capabilities_;

  std::unique_ptr<covenant::storage::rocksdb_storage_t> storage_;
  std::unique_ptr<covenant::ledger::ledger> ledger_;
  std::unique_ptr<covenant::governance::gate> gate_;
  std::unique_ptr<covenant::admission::lazy_queue> lazy_queue_;
  std::unique_ptr<covenant::scheduler::scheduler> scheduler_;
  std::unique_ptr<covenant::admission::router> router_;

  mutable std::mutex state_mutex_;
  std::condition_variable reaper_wakeup_;
  bool running_{};
  bool stopping_{};
  std::thread reaper_;
};

}  // namespace covenant::kernel
