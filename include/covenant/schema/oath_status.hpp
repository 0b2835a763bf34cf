#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: oath status.
// Governance lifecycle of an agent identity: unsworn until an oath verifies,
// invalidated once the governing policy moves on.
namespace covenant::schema {

enum class oath_status_t : uint8_t {
  unsworn = 0,
  sworn = 1,
  invalidated = 2,
};

inline constexpr auto kOathStatusMappings = std::array{
    enum_mapping_t<oath_status_t>{"unsworn", oath_status_t::unsworn},
    enum_mapping_t<oath_status_t>{"sworn", oath_status_t::sworn},
    enum_mapping_t<oath_status_t>{"invalidated", oath_status_t::invalidated}};

inline constexpr std::string_view to_string(const oath_status_t value) {
  return to_string(value, kOathStatusMappings).value_or("unknown");
}

}  // namespace covenant::schema
