#pragma once

#include <boost/asio/thread_pool.hpp>
#include <covenant/admission/intent_classifier.hpp>
#include <covenant/admission/lazy_queue.hpp>
#include <covenant/common/clock.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/scheduler/scheduler.hpp>
#include <covenant/schema/routing_decision.hpp>
#include <covenant/schema/task.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace covenant::admission {

/// Supplies the opaque placement rank of a new task. The router never looks
/// inside it.
using placement_ranker_t =
    std::function<covenant::schema::bytes_t(const covenant::schema::task_spec_t&)>;

/// Completion of an asynchronous admission. error is set, and decision is
/// empty, when admit() threw.
using admission_handler_t =
    std::function<void(std::exception_ptr error,
                       covenant::schema::routing_decision_t decision)>;

inline constexpr auto kQueueSaturatedReason = std::string_view{"queue_saturated"};
inline constexpr auto kLedgerUnavailableReason =
    std::string_view{"ledger_unavailable"};

struct router_options final {
  std::size_t max_input_bytes{10000};
  covenant::schema::duration_milliseconds_t idempotency_window{300000};
  covenant::schema::duration_milliseconds_t classifier_timeout{500};
  std::size_t admission_workers{4};
  /// Classifications allowed to run at once. Beyond that a request falls
  /// back to LOW without waiting.
  std::size_t classifier_workers{4};
  uint32_t max_retries{3};
};

/// Four stage admission pipeline.
///
/// Gate 0 blocks structurally malicious input, gate 1 classifies intent,
/// high and medium requests become tasks at once (gate 2) and low requests
/// need a lazy queue slot first (gate 3). Every outcome is recorded as
/// exactly one REQUEST_ADMITTED or REQUEST_BLOCKED event.
///
/// Identical raw input inside the idempotency window yields the first
/// decision again, including while that decision is still being made.
///
/// Each classification runs on its own detached thread, so a classifier that
/// never returns costs one of classifier_workers slots and never holds up
/// shutdown.
class router final {
 public:
  router(covenant::storage::rocksdb_storage_t& storage,
         covenant::ledger::ledger& ledger,
         covenant::scheduler::scheduler& scheduler,
         lazy_queue& lazy_queue,
         intent_classifier_t classifier,
         placement_ranker_t placement_ranker,
         covenant::common::clock_t clock,
         router_options options = {});
  ~router();

  router(const router&) = delete;
  router& operator=(const router&) = delete;

  /// Rebuild the idempotency index from persisted decisions still inside the
  /// window; older rows are deleted. Returns the count kept.
  std::size_t load();

  covenant::schema::routing_decision_t admit(
      std::string_view raw_input,
      const covenant::schema::agent_id_t& source_agent_id);

  /// admit() on the admission pool.
  std::future<covenant::schema::routing_decision_t> submit(
      std::string raw_input,
      covenant::schema::agent_id_t source_agent_id);

  /// admit() on the admission pool; handler runs on the pool thread. After
  /// shutdown the handler runs at once with a fail-closed decision.
  void submit(std::string raw_input,
              covenant::schema::agent_id_t source_agent_id,
              admission_handler_t handler);

  /// Stop accepting submissions and wait for queued admissions. Each waits
  /// at most classifier_timeout on its classification.
  void shutdown();

 private:
  struct idempotency_entry final {
    covenant::schema::timestamp_milliseconds_t recorded_at{};
    std::shared_future<covenant::schema::routing_decision_t> decision;
  };

  covenant::schema::routing_decision_t decide(
      std::string_view raw_input,
      const covenant::schema::agent_id_t& source_agent_id,
      const covenant::schema::hash32_t& input_hash);

  covenant::schema::routing_decision_t block(
      covenant::schema::routing_decision_t decision,
      std::string reason,
      std::optional<covenant::schema::security_rejection_t> rejection,
      const covenant::schema::hash32_t& input_hash);

  covenant::schema::routing_decision_t accept(
      covenant::schema::routing_decision_t decision,
      std::string_view raw_input,
      const covenant::schema::hash32_t& input_hash);

  classification_t classify(std::string_view raw_input);
  covenant::schema::bytes_t rank(const covenant::schema::task_spec_t& spec);

  /// Drop expired entries and their persisted rows. Caller holds
  /// idempotency_mutex_.
  void prune(covenant::schema::timestamp_milliseconds_t now);

  /// Remove the entry inserted at recorded_at, if it is still there.
  void forget(const covenant::schema::hash32_t& input_hash,
              covenant::schema::timestamp_milliseconds_t recorded_at);

  covenant::storage::rocksdb_storage_t& storage_;
  covenant::ledger::ledger& ledger_;
  covenant::scheduler::scheduler& scheduler_;
  lazy_queue& lazy_queue_;
  intent_classifier_t classifier_;
  placement_ranker_t placement_ranker_;
  covenant::common::clock_t clock_;
  router_options options_;

  std::mutex idempotency_mutex_;
  std::map<covenant::schema::hash32_t, idempotency_entry> index_;
  std::deque<std::pair<covenant::schema::timestamp_milliseconds_t,
                       covenant::schema::hash32_t>>
      expiry_;

  std::atomic<bool> stopped_{false};
  boost::asio::thread_pool admission_pool_;
  std::shared_ptr<std::atomic<std::size_t>> classifications_in_flight_;
};

/// BLAKE3(raw_input || big-endian arrival milliseconds).
covenant::schema::request_id_t make_request_id(
    std::string_view raw_input,
    covenant::schema::timestamp_milliseconds_t arrived_at);

/// Task identity derived from the request that created it.
covenant::schema::task_id_t make_task_id(
    const covenant::schema::request_id_t& request_id);

}  // namespace covenant::admission
