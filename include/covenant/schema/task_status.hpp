#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: task status.
// pending -> claimed -> in_progress -> completed, with failed as a transient
// state that resolves to pending (retry) or dead.
namespace covenant::schema {

enum class task_status_t : uint8_t {
  pending = 0,
  claimed = 1,
  in_progress = 2,
  completed = 3,
  failed = 4,
  dead = 5,
};

inline constexpr auto kTaskStatusMappings = std::array{
    enum_mapping_t<task_status_t>{"PENDING", task_status_t::pending},
    enum_mapping_t<task_status_t>{"CLAIMED", task_status_t::claimed},
    enum_mapping_t<task_status_t>{"IN_PROGRESS", task_status_t::in_progress},
    enum_mapping_t<task_status_t>{"COMPLETED", task_status_t::completed},
    enum_mapping_t<task_status_t>{"FAILED", task_status_t::failed},
    enum_mapping_t<task_status_t>{"DEAD", task_status_t::dead}};

inline constexpr std::string_view to_string(const task_status_t value) {
  return to_string(value, kTaskStatusMappings).value_or("unknown");
}

inline constexpr bool is_terminal(const task_status_t value) {
  return value == task_status_t::completed || value == task_status_t::dead;
}

}  // namespace covenant::schema
