#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/scheduler/scheduler.hpp>
#include <covenant/schema/encoding/scale/event_payloads.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <mutex>
#include <string>
#include <tuple>

using namespace covenant::schema;

namespace covenant::scheduler {

namespace {

scheduling_result_t make_error(const scheduling_error_code code,
                               std::string reason,
                               std::optional<task_t> task = std::nullopt) {
  return scheduling_result_t{.code = static_cast<uint32_t>(code),
                             .log = std::move(reason),
                             .codespace = std::string{kSchedulingCodespace},
                             .task = std::move(task)};
}

std::string short_id(const task_id_t& task_id) {
  return to_hex(bytes_view_t{task_id.data(), 8});
}

}  // namespace

scheduler::scheduler(covenant::storage::rocksdb_storage_t& storage,
                     covenant::ledger::ledger& ledger,
                     agent_authorizer_t agent_authorizer,
                     covenant::common::clock_t clock,
                     scheduler_options options)
    : storage_{storage},
      ledger_{ledger},
      agent_authorizer_{std::move(agent_authorizer)},
      clock_{std::move(clock)},
      options_{options} {}

std::size_t scheduler::load() {
  auto terminal = terminal_tasks_t{};
  auto loaded = std::size_t{};
  {
    auto lock = std::unique_lock{mutex_};
    tasks_.clear();
    pending_.clear();
    auto failed = std::vector<task_t>{};
    for (const auto& [row_key, row_value] :
         storage_.list_by_prefix(key::make_prefix(key::kTaskPrefix))) {
      auto task = encoding::scale::try_decode_task(row_value);
      if (!task) {
        covenant::common::critical("undecodable task row at key {}",
                                   to_hex(row_key));
      }
      if (task->status == task_status_t::pending) {
        pending_.insert(make_priority_key(*task));
      } else if (task->status == task_status_t::failed) {
        failed.push_back(*task);
      }
      auto task_id = task->task_id;
      tasks_.insert_or_assign(task_id, std::move(*task));
    }

    // A stop between TASK_FAILED and its follow-up leaves the row FAILED.
    for (auto& task : failed) {
      spdlog::warn("Task {} was left FAILED; applying its retry budget",
                   short_id(task.task_id));
      auto reason = task.last_error;
      if (resolve_failed(std::move(task), reason, terminal).code != 0) {
        break;
      }
    }
    loaded = tasks_.size();
    spdlog::info("Loaded {} task(s), {} pending", loaded, pending_.size());
  }
  notify(terminal);
  return loaded;
}

void scheduler::set_terminal_listener(terminal_listener_t listener) {
  auto lock = std::unique_lock{mutex_};
  terminal_listener_ = std::move(listener);
}

void scheduler::set_lazy_queue_probe(lazy_queue_probe_t probe) {
  auto lock = std::unique_lock{mutex_};
  lazy_queue_probe_ = std::move(probe);
}

scheduling_result_t scheduler::commit(
    task_t next,
    const ledger_event_type_t event_type,
    const std::string_view detail,
    const std::string_view actor,
    terminal_tasks_t& terminal,
    uint64_t* event_sequence,
    const covenant::storage::write_batch& state_writes) {
  auto payload = event_type == ledger_event_type_t::task_created
                     ? encoding::scale::make_task_created_payload(next)
                     : encoding::scale::make_task_transition_payload(next,
                                                                     detail);
  auto batch = state_writes;
  batch.put(key::make_task_key(next.task_id), encoding::scale::encode_row(next));
  auto appended = ledger_.append(event_type, std::move(payload), actor, batch);
  if (appended.code != 0) {
    spdlog::error("Task {} transition {} not recorded: {}",
                  short_id(next.task_id), to_string(event_type), appended.log);
    return make_error(scheduling_error_code::ledger_unavailable, appended.log);
  }
  if (event_sequence != nullptr) {
    *event_sequence = appended.sequence_number;
  }

  auto found = tasks_.find(next.task_id);
  if (found != std::end(tasks_) &&
      found->second.status == task_status_t::pending) {
    pending_.erase(make_priority_key(found->second));
  }
  if (next.status == task_status_t::pending) {
    pending_.insert(make_priority_key(next));
  }
  if (is_terminal(next.status)) {
    terminal.push_back(next);
  }
  tasks_.insert_or_assign(next.task_id, next);
  return scheduling_result_t{.task = std::move(next)};
}

scheduling_result_t scheduler::fail(task_t task,
                                    std::string reason,
                                    const std::string_view actor,
                                    terminal_tasks_t& terminal) {
  task.status = task_status_t::failed;
  task.attempt_count += 1;
  task.last_error = reason;
  auto failed = commit(task, ledger_event_type_t::task_failed, reason, actor,
                       terminal);
  if (failed.code != 0) {
    return failed;
  }
  return resolve_failed(std::move(task), reason, terminal);
}

scheduling_result_t scheduler::resolve_failed(task_t task,
                                              const std::string& reason,
                                              terminal_tasks_t& terminal) {
  if (task.attempt_count < task.max_retries) {
    task.status = task_status_t::pending;
    task.agent_id.reset();
    task.claimed_at.reset();
    task.started_at.reset();
    spdlog::info("Task {} requeued after attempt {}/{}", short_id(task.task_id),
                 task.attempt_count, task.max_retries);
    return commit(std::move(task), ledger_event_type_t::task_requeued, reason,
                  kSystemActor, terminal);
  }
  task.status = task_status_t::dead;
  task.completed_at = clock_();
  spdlog::warn("Task {} is dead after {} failure(s): {}",
               short_id(task.task_id), task.attempt_count, reason);
  return commit(std::move(task), ledger_event_type_t::task_dead, reason,
                kSystemActor, terminal);
}

void scheduler::notify(const terminal_tasks_t& terminal) const {
  if (terminal.empty()) {
    return;
  }
  auto listener = terminal_listener_t{};
  {
    auto lock = std::shared_lock{mutex_};
    listener = terminal_listener_;
  }
  if (!listener) {
    return;
  }
  for (const auto& task : terminal) {
    listener(task);
  }
}

create_task_result_t scheduler::create_task(
    const task_spec_t& spec,
    const covenant::storage::write_batch& state_writes) {
  auto terminal = terminal_tasks_t{};
  auto lock = std::unique_lock{mutex_};
  if (tasks_.contains(spec.task_id)) {
    return create_task_result_t{.task_id = spec.task_id};
  }

  auto task = task_t{.task_id = spec.task_id,
                     .request_id = spec.request_id,
                     .target_agent_id = spec.target_agent_id,
                     .payload = spec.payload,
                     .routing_tier = spec.routing_tier,
                     .placement_rank = spec.placement_rank,
                     .user_priority = spec.user_priority,
                     .status = task_status_t::pending,
                     .max_retries = spec.max_retries,
                     .created_at = clock_()};
  auto sequence = uint64_t{};
  auto committed = commit(std::move(task), ledger_event_type_t::task_created,
                          "", kSystemActor, terminal, &sequence, state_writes);
  if (committed.code != 0) {
    return create_task_result_t{.code = committed.code,
                                .log = committed.log,
                                .codespace = committed.codespace,
                                .task_id = spec.task_id};
  }
  spdlog::debug("Task {} created at tier {}", short_id(spec.task_id),
                to_string(spec.routing_tier));
  return create_task_result_t{.task_id = spec.task_id,
                              .event_sequence = sequence};
}

std::optional<task_t> scheduler::get_next_task(const agent_id_t& agent_id) {
  return claim_next_task(agent_id).task;
}

scheduling_result_t scheduler::claim_next_task(const agent_id_t& agent_id) {
  auto terminal = terminal_tasks_t{};
  auto lock = std::unique_lock{mutex_};
  if (!agent_authorizer_ || !agent_authorizer_(agent_id)) {
    spdlog::warn("Agent '{}' is not sworn; no task handed out", agent_id);
    return make_error(scheduling_error_code::unauthorized_agent,
                      "agent is not registered with a valid oath");
  }
  if (ledger_.halted()) {
    return make_error(scheduling_error_code::ledger_unavailable,
                      ledger_.halt_reason());
  }

  for (const auto& key : pending_) {
    const auto& candidate = tasks_.at(key.task_id);
    if (candidate.target_agent_id && *candidate.target_agent_id != agent_id) {
      continue;
    }
    auto next = candidate;
    next.status = task_status_t::claimed;
    next.agent_id = agent_id;
    next.claimed_at = clock_();
    // commit() mutates pending_; the loop ends here either way.
    return commit(std::move(next), ledger_event_type_t::task_claimed, "",
                  agent_id, terminal);
  }
  return scheduling_result_t{};
}

scheduling_result_t scheduler::start_task(const task_id_t& task_id,
                                          const agent_id_t& agent_id) {
  auto terminal = terminal_tasks_t{};
  auto lock = std::unique_lock{mutex_};
  auto found = tasks_.find(task_id);
  if (found == std::end(tasks_)) {
    return make_error(scheduling_error_code::not_found, "unknown task");
  }
  if (found->second.status != task_status_t::claimed) {
    return make_error(scheduling_error_code::invalid_state,
                      fmt::format("task is {}", to_string(found->second.status)),
                      found->second);
  }
  if (found->second.agent_id != agent_id) {
    return make_error(scheduling_error_code::not_owner,
                      "task is claimed by another agent", found->second);
  }
  auto next = found->second;
  next.status = task_status_t::in_progress;
  next.started_at = clock_();
  return commit(std::move(next), ledger_event_type_t::task_started, "",
                agent_id, terminal);
}

scheduling_result_t scheduler::report_task_result(const task_id_t& task_id,
                                                  const agent_id_t& agent_id,
                                                  const task_outcome_t outcome,
                                                  bytes_t result_payload) {
  auto terminal = terminal_tasks_t{};
  auto result = scheduling_result_t{};
  {
    auto lock = std::unique_lock{mutex_};
    auto found = tasks_.find(task_id);
    if (found == std::end(tasks_)) {
      return make_error(scheduling_error_code::not_found, "unknown task");
    }
    auto task = found->second;
    if (task.status != task_status_t::claimed &&
        task.status != task_status_t::in_progress) {
      return make_error(scheduling_error_code::invalid_state,
                        fmt::format("task is {}", to_string(task.status)),
                        task);
    }
    if (task.agent_id != agent_id) {
      return make_error(scheduling_error_code::not_owner,
                        "task is claimed by another agent", task);
    }

    if (task.status == task_status_t::claimed) {
      task.status = task_status_t::in_progress;
      task.started_at = clock_();
      auto started = commit(task, ledger_event_type_t::task_started,
                            "implicit start", agent_id, terminal);
      if (started.code != 0) {
        return started;
      }
    }

    if (outcome == task_outcome_t::completed) {
      task.status = task_status_t::completed;
      task.completed_at = clock_();
      task.result_payload = std::move(result_payload);
      result = commit(std::move(task), ledger_event_type_t::task_completed, "",
                      agent_id, terminal);
    } else {
      auto reason = result_payload.empty() ? std::string{"reported failure"}
                                           : make_string(result_payload);
      task.result_payload = std::move(result_payload);
      result = fail(std::move(task), std::move(reason), agent_id, terminal);
    }
  }
  notify(terminal);
  return result;
}

std::size_t scheduler::reap_expired() {
  auto terminal = terminal_tasks_t{};
  auto touched = std::size_t{0};
  {
    auto lock = std::unique_lock{mutex_};
    if (ledger_.halted()) {
      return 0;
    }
    auto now = clock_();
    auto expired = std::vector<task_t>{};
    for (const auto& [task_id, task] : tasks_) {
      if (task.status == task_status_t::claimed && task.claimed_at &&
          now - *task.claimed_at >= options_.claim_timeout) {
        expired.push_back(task);
      } else if (task.status == task_status_t::in_progress &&
                 options_.execution_deadline > 0 && task.started_at &&
                 now - *task.started_at >= options_.execution_deadline) {
        expired.push_back(task);
      }
    }

    for (auto& task : expired) {
      auto outcome = scheduling_result_t{};
      if (task.status == task_status_t::claimed) {
        spdlog::warn("Claim on task {} by '{}' expired", short_id(task.task_id),
                     task.agent_id.value_or(""));
        task.status = task_status_t::pending;
        task.agent_id.reset();
        task.claimed_at.reset();
        outcome = commit(std::move(task), ledger_event_type_t::task_claim_expired,
                         "claim_timeout", kSystemActor, terminal);
      } else {
        outcome = fail(std::move(task), "deadline_exceeded", kSystemActor,
                       terminal);
      }
      if (outcome.code != 0) {
        break;
      }
      ++touched;
    }
  }
  notify(terminal);
  return touched;
}

queue_status_t scheduler::queue_status() const {
  auto status = queue_status_t{};
  auto probe = lazy_queue_probe_t{};
  {
    auto lock = std::shared_lock{mutex_};
    probe = lazy_queue_probe_;
    for (const auto& [task_id, task] : tasks_) {
      status.failed += task.attempt_count;
      switch (task.status) {
        case task_status_t::pending:
          ++status.pending;
          break;
        case task_status_t::claimed:
          ++status.claimed;
          break;
        case task_status_t::in_progress:
          ++status.in_progress;
          break;
        case task_status_t::completed:
          ++status.completed;
          break;
        case task_status_t::dead:
          ++status.dead;
          break;
        case task_status_t::failed:
          break;
      }
      if (is_terminal(task.status)) {
        continue;
      }
      switch (task.routing_tier) {
        case routing_tier_t::high:
          ++status.high;
          break;
        case routing_tier_t::medium:
          ++status.medium;
          break;
        case routing_tier_t::low:
          ++status.low;
          break;
        case routing_tier_t::blocked:
          break;
      }
    }
  }
  if (probe) {
    std::tie(status.lazy_queue_depth, status.lazy_queue_capacity) = probe();
  }
  auto head = ledger_.head();
  if (head.count > 0) {
    status.ledger_head_sequence = head.sequence_number;
  }
  status.degraded = ledger_.halted();
  if (status.degraded) {
    status.degraded_reason = ledger_.halt_reason();
  }
  return status;
}

std::optional<task_t> scheduler::find_task(const task_id_t& task_id) const {
  auto lock = std::shared_lock{mutex_};
  auto found = tasks_.find(task_id);
  if (found == std::end(tasks_)) {
    return std::nullopt;
  }
  return found->second;
}

}  // namespace covenant::scheduler
