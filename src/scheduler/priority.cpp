#include <covenant/scheduler/priority.hpp>

#include <algorithm>
#include <tuple>

namespace covenant::scheduler {

bool priority_key::operator<(const priority_key& other) const {
  if (tier_rank != other.tier_rank) {
    return tier_rank < other.tier_rank;
  }
  if (placement_rank != other.placement_rank) {
    return std::ranges::lexicographical_compare(placement_rank,
                                                other.placement_rank);
  }
  // Higher user priority first.
  return std::tie(other.user_priority, created_at, task_id) <
         std::tie(user_priority, other.created_at, other.task_id);
}

priority_key make_priority_key(const covenant::schema::task_t& task) {
  return priority_key{.tier_rank = covenant::schema::tier_rank(task.routing_tier),
                      .placement_rank = task.placement_rank,
                      .user_priority = task.user_priority,
                      .created_at = task.created_at,
                      .task_id = task.task_id};
}

}  // namespace covenant::scheduler
