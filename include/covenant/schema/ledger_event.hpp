#pragma once

#include <covenant/schema/ledger_event_type.hpp>
#include <covenant/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct ledger_event;

/// One link of the hash chain.
///
/// hash = BLAKE3(prev_hash || canonical bytes), where the canonical bytes are
/// the SCALE encoding of (sequence_number, event_type, payload, timestamp,
/// actor). The genesis event links to the zero hash.
template <>
struct ledger_event<1> final {
  uint16_t version{1};
  uint64_t sequence_number{};
  hash32_t prev_hash{};
  hash32_t hash{};
  ledger_event_type_t event_type{};
  bytes_t payload;
  timestamp_milliseconds_t timestamp{};
  std::string actor;
};

using ledger_event_t = ledger_event<1>;

/// Published tip of the chain. count is zero for an empty ledger, in which
/// case sequence_number and hash are meaningless.
struct ledger_head final {
  uint64_t sequence_number{};
  hash32_t hash{};
  uint64_t count{};
};

}  // namespace covenant::schema
