#pragma once

#include <covenant/schema/ledger_event.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace covenant::ledger {

/// Told the sequence number and reason when a cursor meets a bad row.
using corruption_handler_t =
    std::function<void(uint64_t sequence_number, const std::string& reason)>;

/// Lazy, finite walk over ledger events.
///
/// The upper bound is the head published when the cursor was created, so a
/// cursor never observes a partially written suffix and always terminates.
/// Rows are fetched from storage a page at a time; the cursor can be rewound
/// with restart() or resumed elsewhere by opening a new cursor at position().
///
/// A row that cannot be decoded ends the walk. position() then names the bad
/// sequence number and corruption() the reason.
class event_cursor final {
 public:
  event_cursor(const covenant::storage::rocksdb_storage_t& storage,
               uint64_t from,
               std::optional<uint64_t> last,
               std::size_t page_size,
               corruption_handler_t on_corruption = {});

  /// Next event, or std::nullopt once the bound or a corrupt row is reached.
  std::optional<covenant::schema::ledger_event_t> next();

  /// Rewind to the sequence number the cursor was opened at.
  void restart();

  /// Sequence number the next call to next() will return.
  uint64_t position() const { return next_; }

  /// Last sequence number this cursor will return, if any.
  std::optional<uint64_t> bound() const { return last_; }

  const std::optional<std::string>& corruption() const { return corruption_; }

 private:
  void fill();

  const covenant::storage::rocksdb_storage_t& storage_;
  uint64_t from_{};
  uint64_t next_{};
  std::optional<uint64_t> last_;
  std::size_t page_size_{};
  corruption_handler_t on_corruption_;
  std::optional<std::string> corruption_;
  std::deque<covenant::schema::ledger_event_t> buffer_;
};

}  // namespace covenant::ledger
