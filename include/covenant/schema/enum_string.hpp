#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>

namespace covenant::schema {

/// One row of an enum's spelling table. Tables live beside the enum and are
/// the only place its log, wire and config names are written down.
template <typename Enum>
struct enum_mapping_t final {
  std::string_view name;
  Enum value;
};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view name,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found = std::ranges::find(mappings, name, &enum_mapping_t<Enum>::name);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->value;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  auto found = std::ranges::find(mappings, value, &enum_mapping_t<Enum>::value);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->name;
}

}  // namespace covenant::schema
