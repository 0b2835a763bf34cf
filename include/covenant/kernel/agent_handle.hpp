#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/routing_decision.hpp>
#include <covenant/schema/scheduling_result.hpp>
#include <covenant/schema/task.hpp>
#include <covenant/schema/task_outcome.hpp>

#include <functional>
#include <future>
#include <optional>
#include <string>

namespace covenant::kernel {

/// Narrow view of the kernel for a single agent.
///
/// Built from callbacks bound by the kernel, so an agent only reaches the
/// operations listed here and always acts under its own id.
class agent_handle final {
 public:
  struct callbacks final {
    std::function<std::optional<covenant::schema::task_t>(
        const covenant::schema::agent_id_t&)>
        next_task;
    std::function<covenant::schema::scheduling_result_t(
        const covenant::schema::task_id_t&,
        const covenant::schema::agent_id_t&)>
        start;
    std::function<covenant::schema::scheduling_result_t(
        const covenant::schema::task_id_t&,
        const covenant::schema::agent_id_t&,
        covenant::schema::task_outcome_t,
        covenant::schema::bytes_t)>
        report;
    std::function<std::future<covenant::schema::routing_decision_t>(
        std::string,
        const covenant::schema::agent_id_t&)>
        submit;
  };

  agent_handle(covenant::schema::agent_id_t agent_id, callbacks callbacks);

  const covenant::schema::agent_id_t& agent_id() const { return agent_id_; }

  std::optional<covenant::schema::task_t> next_task() const;
  covenant::schema::scheduling_result_t start(
      const covenant::schema::task_id_t& task_id) const;
  covenant::schema::scheduling_result_t report(
      const covenant::schema::task_id_t& task_id,
      covenant::schema::task_outcome_t outcome,
      covenant::schema::bytes_t result_payload = {}) const;

  /// Hand new work to the router on behalf of this agent.
  std::future<covenant::schema::routing_decision_t> submit(
      std::string raw_input) const;

 private:
  covenant::schema::agent_id_t agent_id_;
  callbacks callbacks_;
};

}  // namespace covenant::kernel
