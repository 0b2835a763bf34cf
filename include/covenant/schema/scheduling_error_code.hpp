#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace covenant::schema {

inline constexpr auto kSchedulingCodespace = std::string_view{"scheduler"};

enum class scheduling_error_code : uint32_t {
  not_owner = 1,
  invalid_state = 2,
  not_found = 3,
  unauthorized_agent = 4,
  ledger_unavailable = 5,
};

inline constexpr auto kSchedulingErrorCodeMappings = std::array{
    enum_mapping_t<scheduling_error_code>{"not_owner",
                                          scheduling_error_code::not_owner},
    enum_mapping_t<scheduling_error_code>{"invalid_state",
                                          scheduling_error_code::invalid_state},
    enum_mapping_t<scheduling_error_code>{"not_found",
                                          scheduling_error_code::not_found},
    enum_mapping_t<scheduling_error_code>{
        "unauthorized_agent", scheduling_error_code::unauthorized_agent},
    enum_mapping_t<scheduling_error_code>{
        "ledger_unavailable", scheduling_error_code::ledger_unavailable}};

inline constexpr std::string_view to_string(const scheduling_error_code value) {
  return to_string(value, kSchedulingErrorCodeMappings).value_or("unknown");
}

}  // namespace covenant::schema
