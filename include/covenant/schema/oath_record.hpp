#pragma once

#include <covenant/schema/primitives.hpp>

#include <cstdint>

namespace covenant::schema {

template <uint16_t Version>
struct oath_record;

template <>
struct oath_record<1> final {
  uint16_t version{1};
  agent_id_t agent_id;
  hash32_t policy_hash{};
  signature_t signature;
  timestamp_milliseconds_t sworn_at{};
  /// Recomputed against the current policy hash on every read.
  bool valid{};
};

using oath_record_t = oath_record<1>;

}  // namespace covenant::schema
