#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct queue_status;

template <>
struct queue_status<1> final {
  uint16_t version{1};
  uint64_t pending{};
  uint64_t claimed{};
  uint64_t in_progress{};
  uint64_t completed{};
  /// Failure reports recorded, including ones that were later retried.
  uint64_t failed{};
  uint64_t dead{};
  /// Non-terminal tasks per tier.
  uint64_t high{};
  uint64_t medium{};
  uint64_t low{};
  uint64_t lazy_queue_depth{};
  uint64_t lazy_queue_capacity{};
  std::optional<uint64_t> ledger_head_sequence;
  bool degraded{};
  std::string degraded_reason;
};

using queue_status_t = queue_status<1>;

}  // namespace covenant::schema
