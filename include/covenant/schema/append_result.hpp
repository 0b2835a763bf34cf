#pragma once

#include <covenant/schema/ledger_error_code.hpp>
#include <covenant/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct append_result;

template <>
struct append_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  uint64_t sequence_number{};
  hash32_t hash{};
};

using append_result_t = append_result<1>;

template <uint16_t Version>
struct chain_verification_result;

template <>
struct chain_verification_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  bool valid{};
  uint64_t events_checked{};
  /// First sequence number that failed verification.
  std::optional<uint64_t> failed_sequence;
};

using chain_verification_result_t = chain_verification_result<1>;

}  // namespace covenant::schema
