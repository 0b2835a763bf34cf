#pragma once

#include <covenant/common/clock.hpp>
#include <covenant/ledger/event_cursor.hpp>
#include <covenant/schema/append_result.hpp>
#include <covenant/schema/ledger_event.hpp>
#include <covenant/schema/ledger_event_type.hpp>
#include <covenant/schema/primitives.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

namespace covenant::ledger {

struct ledger_options final {
  /// Total write attempts before the ledger halts.
  uint32_t persistence_retry_attempts{5};
  /// Delay before the first retry; doubles on every further attempt.
  covenant::schema::duration_milliseconds_t persistence_backoff{10};
  std::size_t cursor_page_size{256};
};

/// Builds state rows for an event once its sequence number is known.
using state_writes_builder_t =
    std::function<covenant::storage::write_batch(uint64_t sequence_number)>;

/// Append-only, hash-chained event store.
///
/// Appends are serialized by a single writer mutex. The event row, the head
/// pointer and any caller supplied state rows are committed in one synced
/// RocksDB batch, so state and its audit record become durable together.
/// Once halted (corruption or exhausted persistence retries) every append
/// fails closed until the process is restarted against repaired storage.
class ledger final {
 public:
  ledger(covenant::storage::rocksdb_storage_t& storage,
         covenant::common::clock_t clock,
         ledger_options options = {});

  /// Reload the head pointer and check it against the last row. Returns
  /// false (and halts) when they disagree.
  bool recover();

  /// Append one event. state_writes are committed atomically with it.
  covenant::schema::append_result_t append(
      covenant::schema::ledger_event_type_t event_type,
      covenant::schema::bytes_t payload,
      std::string_view actor,
      const covenant::storage::write_batch& state_writes = {});

  /// As above, for state rows that record the event's own sequence number.
  covenant::schema::append_result_t append(
      covenant::schema::ledger_event_type_t event_type,
      covenant::schema::bytes_t payload,
      std::string_view actor,
      const state_writes_builder_t& build_state_writes);

  /// Recompute the chain up to the head published at the call, without
  /// blocking appends. The first mismatch halts the ledger.
  covenant::schema::chain_verification_result_t verify_chain_integrity();

  /// Cursor over [sequence_number, head at creation]. A corrupt row it meets
  /// halts the ledger.
  event_cursor events_since(uint64_t sequence_number);

  covenant::schema::ledger_head head() const;
  std::optional<covenant::schema::ledger_event_t> find(
      uint64_t sequence_number) const;

  bool halted() const;
  std::string halt_reason() const;

 private:
  void halt(std::string reason);
  covenant::storage::write_status commit_with_retry(
      const covenant::storage::write_batch& batch);

  std::mutex append_mutex_;
  mutable std::shared_mutex head_mutex_;
  covenant::storage::rocksdb_storage_t& storage_;
  covenant::common::clock_t clock_;
  ledger_options options_;
  covenant::schema::ledger_head head_;
  std::atomic<bool> halted_{false};
  std::string halt_reason_;
};

/// hash = BLAKE3(prev_hash || canonical bytes).
covenant::schema::hash32_t compute_event_hash(
    const covenant::schema::ledger_event_t& event);

}  // namespace covenant::ledger
