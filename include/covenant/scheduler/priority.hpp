#pragma once

#include <covenant/schema/primitives.hpp>
#include <covenant/schema/task.hpp>

#include <compare>
#include <cstdint>

namespace covenant::scheduler {

/// Sort key of a pending task; smaller keys are served first.
///
/// tier (high, medium, low), then placement rank bytewise, then
/// user_priority descending, then created_at ascending, then task_id.
struct priority_key final {
  uint8_t tier_rank{};
  covenant::schema::bytes_t placement_rank;
  int32_t user_priority{};
  covenant::schema::timestamp_milliseconds_t created_at{};
  covenant::schema::task_id_t task_id{};

  bool operator<(const priority_key& other) const;
  bool operator==(const priority_key& other) const = default;
};

priority_key make_priority_key(const covenant::schema::task_t& task);

}  // namespace covenant::scheduler
