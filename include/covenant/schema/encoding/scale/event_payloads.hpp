#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/routing_decision.hpp>
#include <covenant/schema/task.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Ledger event payloads, SCALE encoded. The payload shape is keyed by the
// event type; readers that need a field decode the matching tuple.
namespace covenant::schema::encoding::scale {

/// OATH_SWORN: (agent_id, policy_hash, signer bytes, capabilities).
bytes_t make_oath_sworn_payload(const agent_id_t& agent_id,
                                const hash32_t& policy_hash,
                                const signer_id_t& signer,
                                const std::vector<std::string>& capabilities);

/// OATH_REJECTED: (agent_id, policy_hash, reason).
bytes_t make_oath_rejected_payload(const agent_id_t& agent_id,
                                   const hash32_t& policy_hash,
                                   std::string_view reason);

/// OATH_INVALIDATED: (agent_id, oath policy_hash, current policy_hash).
bytes_t make_oath_invalidated_payload(const agent_id_t& agent_id,
                                      const hash32_t& oath_policy_hash,
                                      const hash32_t& current_policy_hash);

/// REQUEST_ADMITTED / REQUEST_BLOCKED: (request_id, tier, reason, rejection,
/// source_agent_id, created_task_id).
bytes_t make_request_payload(const routing_decision_t& decision);

/// TASK_CREATED: (task_id, request_id, tier, placement_rank, user_priority,
/// max_retries, target_agent_id).
bytes_t make_task_created_payload(const task_t& task);

/// Every other task transition: (task_id, agent_id, attempt_count, detail).
bytes_t make_task_transition_payload(const task_t& task,
                                     std::string_view detail);

struct task_transition_payload final {
  task_id_t task_id{};
  std::string agent_id;
  uint32_t attempt_count{};
  std::string detail;
};

std::optional<task_transition_payload> try_decode_task_transition_payload(
    const bytes_view_t& bytes);

}  // namespace covenant::schema::encoding::scale
