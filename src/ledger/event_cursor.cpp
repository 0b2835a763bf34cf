#include <spdlog/spdlog.h>
#include <covenant/ledger/event_cursor.hpp>
#include <covenant/schema/encoding/scale/rows.hpp>
#include <covenant/schema/key/kernel_keys.hpp>

#include <algorithm>
#include <utility>

using namespace covenant::schema;

namespace covenant::ledger {

event_cursor::event_cursor(const covenant::storage::rocksdb_storage_t& storage,
                           const uint64_t from,
                           const std::optional<uint64_t> last,
                           const std::size_t page_size,
                           corruption_handler_t on_corruption)
    : storage_{storage},
      from_{from},
      next_{from},
      last_{last},
      page_size_{std::max<std::size_t>(page_size, 1)},
      on_corruption_{std::move(on_corruption)} {}

void event_cursor::restart() {
  buffer_.clear();
  corruption_.reset();
  next_ = from_;
}

void event_cursor::fill() {
  if (!last_ || next_ > *last_) {
    return;
  }
  auto remaining = static_cast<std::size_t>(*last_ - next_ + 1);
  auto prefix = key::make_prefix(key::kLedgerEventPrefix);
  auto start = key::make_ledger_event_key(next_);
  auto rows = storage_.list_range(prefix, start, std::min(remaining, page_size_));
  for (const auto& [row_key, row_value] : rows) {
    auto sequence = key::try_parse_ledger_event_key(row_key);
    auto event = encoding::scale::try_decode_ledger_event(row_value);
    if (!sequence || !event || event->sequence_number != *sequence) {
      auto at = sequence.value_or(next_ + buffer_.size());
      corruption_ = fmt::format("undecodable ledger row at key {}",
                                to_hex(row_key));
      spdlog::error("Event cursor stopped at sequence {}: {}", at,
                    *corruption_);
      if (on_corruption_) {
        on_corruption_(at, *corruption_);
      }
      // Events decoded before the bad row are still handed out.
      return;
    }
    buffer_.push_back(std::move(*event));
  }
}

std::optional<ledger_event_t> event_cursor::next() {
  if (buffer_.empty() && !corruption_) {
    fill();
  }
  if (buffer_.empty()) {
    // Bound reached, or the rows below the bound are gone.
    if (last_ && !corruption_) {
      next_ = std::max(next_, *last_ + 1);
    }
    return std::nullopt;
  }
  auto event = std::move(buffer_.front());
  buffer_.pop_front();
  next_ = event.sequence_number + 1;
  return event;
}

}  // namespace covenant::ledger
