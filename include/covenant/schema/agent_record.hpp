#pragma once

#include <covenant/schema/oath_status.hpp>
#include <covenant/schema/primitives.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace covenant::schema {

template <uint16_t Version>
struct agent_record;

template <>
struct agent_record<1> final {
  uint16_t version{1};
  agent_id_t agent_id;
  signer_id_t public_key;
  /// Sorted, duplicate free.
  std::vector<std::string> capabilities;
  oath_status_t oath_status{oath_status_t::unsworn};
  /// Ledger sequence of the OATH_SWORN event backing the current oath.
  uint64_t oath_event_id{};
  hash32_t policy_hash{};
  timestamp_milliseconds_t registered_at{};
};

using agent_record_t = agent_record<1>;

}  // namespace covenant::schema
