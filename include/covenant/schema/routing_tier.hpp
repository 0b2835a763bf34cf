#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: routing tier.
// Coarse admission class assigned before a request becomes a task. Blocked
// requests never reach the scheduler.
namespace covenant::schema {

enum class routing_tier_t : uint8_t {
  blocked = 0,
  low = 1,
  medium = 2,
  high = 3,
};

inline constexpr auto kRoutingTierMappings = std::array{
    enum_mapping_t<routing_tier_t>{"BLOCKED", routing_tier_t::blocked},
    enum_mapping_t<routing_tier_t>{"LOW", routing_tier_t::low},
    enum_mapping_t<routing_tier_t>{"MEDIUM", routing_tier_t::medium},
    enum_mapping_t<routing_tier_t>{"HIGH", routing_tier_t::high}};

inline constexpr std::string_view to_string(const routing_tier_t value) {
  return to_string(value, kRoutingTierMappings).value_or("unknown");
}

/// Scheduling rank of a tier: 0 is served first.
inline constexpr uint8_t tier_rank(const routing_tier_t value) {
  switch (value) {
    case routing_tier_t::high:
      return 0;
    case routing_tier_t::medium:
      return 1;
    case routing_tier_t::low:
      return 2;
    case routing_tier_t::blocked:
    default:
      return 3;
  }
}

}  // namespace covenant::schema
