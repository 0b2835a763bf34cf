#pragma once

#include <covenant/schema/scheduling_error_code.hpp>
#include <covenant/schema/task.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct scheduling_result;

template <>
struct scheduling_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  /// Task state after the call; absent on not_found.
  std::optional<task_t> task;
};

using scheduling_result_t = scheduling_result<1>;

template <uint16_t Version>
struct create_task_result;

template <>
struct create_task_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  task_id_t task_id{};
  /// Sequence of the TASK_CREATED event.
  uint64_t event_sequence{};
};

using create_task_result_t = create_task_result<1>;

}  // namespace covenant::schema
