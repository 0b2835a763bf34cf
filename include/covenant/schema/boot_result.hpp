#pragma once

#include <cstdint>
#include <string>

namespace covenant::schema {

template <uint16_t Version>
struct boot_result;

template <>
struct boot_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  /// Name of the boot phase that failed, empty on success.
  std::string failed_phase;
  uint32_t phases_completed{};
};

using boot_result_t = boot_result<1>;

}  // namespace covenant::schema
