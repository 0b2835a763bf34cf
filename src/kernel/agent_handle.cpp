#include <covenant/kernel/agent_handle.hpp>

#include <utility>

using namespace covenant::schema;

namespace covenant::kernel {

agent_handle::agent_handle(agent_id_t agent_id, callbacks callbacks)
    : agent_id_{std::move(agent_id)}, callbacks_{std::move(callbacks)} {}

std::optional<task_t> agent_handle::next_task() const {
  return callbacks_.next_task(agent_id_);
}

scheduling_result_t agent_handle::start(const task_id_t& task_id) const {
  return callbacks_.start(task_id, agent_id_);
}

scheduling_result_t agent_handle::report(const task_id_t& task_id,
                                         const task_outcome_t outcome,
                                         bytes_t result_payload) const {
  return callbacks_.report(task_id, agent_id_, outcome,
                           std::move(result_payload));
}

std::future<routing_decision_t> agent_handle::submit(
    std::string raw_input) const {
  return callbacks_.submit(std::move(raw_input), agent_id_);
}

}  // namespace covenant::kernel
