#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace covenant::schema {

inline constexpr auto kGovernanceCodespace = std::string_view{"governance"};

enum class governance_error_code : uint32_t {
  invalid_signature = 1,
  oath_stale = 2,
  already_registered = 3,
  not_registered = 4,
  invalid_request = 5,
  ledger_unavailable = 6,
};

inline constexpr auto kGovernanceErrorCodeMappings = std::array{
    enum_mapping_t<governance_error_code>{
        "invalid_signature", governance_error_code::invalid_signature},
    enum_mapping_t<governance_error_code>{"oath_stale",
                                          governance_error_code::oath_stale},
    enum_mapping_t<governance_error_code>{
        "already_registered", governance_error_code::already_registered},
    enum_mapping_t<governance_error_code>{
        "not_registered", governance_error_code::not_registered},
    enum_mapping_t<governance_error_code>{
        "invalid_request", governance_error_code::invalid_request},
    enum_mapping_t<governance_error_code>{
        "ledger_unavailable", governance_error_code::ledger_unavailable}};

inline constexpr std::string_view to_string(const governance_error_code value) {
  return to_string(value, kGovernanceErrorCodeMappings).value_or("unknown");
}

}  // namespace covenant::schema
