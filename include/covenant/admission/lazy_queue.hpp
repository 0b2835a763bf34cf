#pragma once

#include <covenant/common/clock.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <vector>

namespace covenant::admission {

enum class reserve_result {
  reserved,
  saturated,
  unavailable,
};

/// Gate 3. Bounded set of outstanding LOW tasks.
///
/// A slot is reserved before the task exists and released when the task
/// reaches a terminal state, so capacity bounds LOW work that is queued or
/// running. Slots are persisted and survive restarts.
class lazy_queue final {
 public:
  lazy_queue(covenant::storage::rocksdb_storage_t& storage,
             std::size_t capacity,
             covenant::common::clock_t clock);

  /// Reload slots from storage. Returns the count loaded.
  std::size_t load();

  reserve_result try_reserve(const covenant::schema::task_id_t& task_id,
                             const covenant::schema::request_id_t& request_id);

  /// Free the slot held by task_id. Returns false when it held none.
  bool release(const covenant::schema::task_id_t& task_id);

  bool contains(const covenant::schema::task_id_t& task_id) const;
  std::vector<covenant::schema::task_id_t> entries() const;
  std::size_t depth() const;
  std::size_t capacity() const { return capacity_; }

 private:
  struct slot final {
    covenant::schema::request_id_t request_id{};
    covenant::schema::timestamp_milliseconds_t enqueued_at{};
  };

  mutable std::mutex mutex_;
  covenant::storage::rocksdb_storage_t& storage_;
  std::size_t capacity_{};
  covenant::common::clock_t clock_;
  std::map<covenant::schema::task_id_t, slot> slots_;
};

}  // namespace covenant::admission
