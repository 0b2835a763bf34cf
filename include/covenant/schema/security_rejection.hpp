#pragma once

#include <covenant/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: security rejection.
// Terminal for the request that triggered it; the caller may submit a new
// request later.
namespace covenant::schema {

enum class security_rejection_t : uint8_t {
  malicious_input = 1,
  queue_saturated = 2,
};

inline constexpr auto kSecurityRejectionMappings = std::array{
    enum_mapping_t<security_rejection_t>{"malicious_input",
                                         security_rejection_t::malicious_input},
    enum_mapping_t<security_rejection_t>{
        "queue_saturated", security_rejection_t::queue_saturated}};

inline constexpr std::string_view to_string(const security_rejection_t value) {
  return to_string(value, kSecurityRejectionMappings).value_or("unknown");
}

}  // namespace covenant::schema
