#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/routing_tier.hpp>
#include <covenant/schema/task_status.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct task_spec;

/// What the router hands the scheduler; identity and tier are decided
/// upstream.
template <>
struct task_spec<1> final {
  uint16_t version{1};
  task_id_t task_id{};
  request_id_t request_id{};
  bytes_t payload;
  routing_tier_t routing_tier{routing_tier_t::medium};
  bytes_t placement_rank;
  int32_t user_priority{};
  uint32_t max_retries{3};
  std::optional<agent_id_t> target_agent_id;
};

using task_spec_t = task_spec<1>;

template <uint16_t Version>
struct task;

template <>
struct task<1> final {
  uint16_t version{1};
  task_id_t task_id{};
  request_id_t request_id{};
  /// Owner while CLAIMED or IN_PROGRESS, kept on terminal tasks, cleared
  /// when the task returns to PENDING.
  std::optional<agent_id_t> agent_id;
  std::optional<agent_id_t> target_agent_id;
  bytes_t payload;
  routing_tier_t routing_tier{routing_tier_t::medium};
  /// Opaque, compared lexicographically and never interpreted.
  bytes_t placement_rank;
  int32_t user_priority{};
  task_status_t status{task_status_t::pending};
  uint32_t attempt_count{};
  uint32_t max_retries{3};
  timestamp_milliseconds_t created_at{};
  std::optional<timestamp_milliseconds_t> claimed_at;
  std::optional<timestamp_milliseconds_t> started_at;
  std::optional<timestamp_milliseconds_t> completed_at;
  bytes_t result_payload;
  std::string last_error;
};

using task_t = task<1>;

}  // namespace covenant::schema
