#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/routing_tier.hpp>
#include <covenant/schema/security_rejection.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace covenant::schema {

template <uint16_t Version>
struct routing_decision;

template <>
struct routing_decision<1> final {
  uint16_t version{1};
  request_id_t request_id{};
  routing_tier_t tier{routing_tier_t::blocked};
  std::string reason;
  std::optional<security_rejection_t> rejection;
  /// Absent when the request was blocked.
  std::optional<task_id_t> created_task_id;
  std::vector<std::string> concepts;
  agent_id_t source_agent_id;
  timestamp_milliseconds_t arrived_at{};
};

using routing_decision_t = routing_decision<1>;

}  // namespace covenant::schema
