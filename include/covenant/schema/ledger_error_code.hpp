#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace covenant::schema {

inline constexpr auto kLedgerCodespace = std::string_view{"ledger"};

enum class ledger_error_code : uint32_t {
  corrupted = 1,
  persistence_failed = 2,
  halted = 3,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    enum_mapping_t<ledger_error_code>{"corrupted",
                                      ledger_error_code::corrupted},
    enum_mapping_t<ledger_error_code>{"persistence_failed",
                                      ledger_error_code::persistence_failed},
    enum_mapping_t<ledger_error_code>{"halted", ledger_error_code::halted}};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings).value_or("unknown");
}

}  // namespace covenant::schema
