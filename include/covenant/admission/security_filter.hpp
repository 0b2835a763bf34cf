#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace covenant::admission {

inline constexpr std::size_t kDefaultMaxInputBytes = 10000;

/// Gate 0. Structural checks only: no allocation, one pass per pattern.
///
/// Returns the reason the input must be blocked, or std::nullopt when it may
/// continue to classification. Reasons are static strings.
std::optional<std::string_view> inspect(
    std::string_view input,
    std::size_t max_input_bytes = kDefaultMaxInputBytes);

}  // namespace covenant::admission
