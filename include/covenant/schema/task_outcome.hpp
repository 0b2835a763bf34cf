#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: task outcome reported by an agent.
namespace covenant::schema {

enum class task_outcome_t : uint8_t {
  completed = 0,
  failed = 1,
};

inline constexpr auto kTaskOutcomeMappings = std::array{
    enum_mapping_t<task_outcome_t>{"COMPLETED", task_outcome_t::completed},
    enum_mapping_t<task_outcome_t>{"FAILED", task_outcome_t::failed}};

inline constexpr std::string_view to_string(const task_outcome_t value) {
  return to_string(value, kTaskOutcomeMappings).value_or("unknown");
}

}  // namespace covenant::schema
