#pragma once

#include <covenant/common/clock.hpp>
#include <covenant/ledger/ledger.hpp>
#include <covenant/scheduler/priority.hpp>
#include <covenant/schema/ledger_event_type.hpp>
#include <covenant/schema/queue_status.hpp>
#include <covenant/schema/scheduling_result.hpp>
#include <covenant/schema/task.hpp>
#include <covenant/schema/task_outcome.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace covenant::scheduler {

/// True when the agent may receive work (sworn oath).
using agent_authorizer_t = std::function<bool(std::string_view agent_id)>;

/// Invoked, outside the scheduler lock, whenever a task becomes COMPLETED or
/// DEAD.
using terminal_listener_t =
    std::function<void(const covenant::schema::task_t& task)>;

/// (depth, capacity) of the lazy queue for queue_status.
using lazy_queue_probe_t = std::function<std::pair<uint64_t, uint64_t>()>;

struct scheduler_options final {
  covenant::schema::duration_milliseconds_t claim_timeout{30000};
  /// 0 disables the execution deadline.
  covenant::schema::duration_milliseconds_t execution_deadline{0};
};

/// Task registry and the only writer of task state.
///
/// Selection and claim happen under one exclusive lock, so concurrent
/// get_next_task calls can never hand the same task to two agents. Every
/// state change is committed together with its ledger event; when the ledger
/// refuses the append the in-memory state is left untouched.
class scheduler final {
 public:
  scheduler(covenant::storage::rocksdb_storage_t& storage,
            covenant::ledger::ledger& ledger,
            agent_authorizer_t agent_authorizer,
            covenant::common::clock_t clock,
            scheduler_options options = {});

  /// Rebuild the task table from storage. Rows left FAILED by an interrupted
  /// transition are requeued or marked dead. Returns the count loaded.
  std::size_t load();

  void set_terminal_listener(terminal_listener_t listener);
  void set_lazy_queue_probe(lazy_queue_probe_t probe);

  /// state_writes are committed in the same batch as the task row.
  covenant::schema::create_task_result_t create_task(
      const covenant::schema::task_spec_t& spec,
      const covenant::storage::write_batch& state_writes = {});

  /// Claim the most urgent pending task the agent may take.
  std::optional<covenant::schema::task_t> get_next_task(
      const covenant::schema::agent_id_t& agent_id);

  /// get_next_task with the reason when nothing was claimed.
  covenant::schema::scheduling_result_t claim_next_task(
      const covenant::schema::agent_id_t& agent_id);

  /// CLAIMED -> IN_PROGRESS.
  covenant::schema::scheduling_result_t start_task(
      const covenant::schema::task_id_t& task_id,
      const covenant::schema::agent_id_t& agent_id);

  covenant::schema::scheduling_result_t report_task_result(
      const covenant::schema::task_id_t& task_id,
      const covenant::schema::agent_id_t& agent_id,
      covenant::schema::task_outcome_t outcome,
      covenant::schema::bytes_t result_payload);

  /// Return stale claims to PENDING and fail overdue executions. Returns the
  /// number of tasks touched.
  std::size_t reap_expired();

  covenant::schema::queue_status_t queue_status() const;

  std::optional<covenant::schema::task_t> find_task(
      const covenant::schema::task_id_t& task_id) const;

 private:
  using terminal_tasks_t = std::vector<covenant::schema::task_t>;

  /// Persist next with its ledger event and swap it into the table.
  covenant::schema::scheduling_result_t commit(
      covenant::schema::task_t next,
      covenant::schema::ledger_event_type_t event_type,
      std::string_view detail,
      std::string_view actor,
      terminal_tasks_t& terminal,
      uint64_t* event_sequence = nullptr,
      const covenant::storage::write_batch& state_writes = {});

  /// FAILED, then PENDING or DEAD depending on the retry budget.
  covenant::schema::scheduling_result_t fail(covenant::schema::task_t task,
                                             std::string reason,
                                             std::string_view actor,
                                             terminal_tasks_t& terminal);

  /// FAILED -> PENDING (TASK_REQUEUED) or DEAD (TASK_DEAD).
  covenant::schema::scheduling_result_t resolve_failed(
      covenant::schema::task_t task,
      const std::string& reason,
      terminal_tasks_t& terminal);

  void notify(const terminal_tasks_t& terminal) const;

  mutable std::shared_mutex mutex_;
  covenant::storage::rocksdb_storage_t& storage_;
  covenant::ledger::ledger& ledger_;
  agent_authorizer_t agent_authorizer_;
  covenant::common::clock_t clock_;
  scheduler_options options_;
  terminal_listener_t terminal_listener_;
  lazy_queue_probe_t lazy_queue_probe_;
  std::map<covenant::schema::task_id_t, covenant::schema::task_t> tasks_;
  std::set<priority_key> pending_;
};

}  // namespace covenant::scheduler
