#pragma once

#include <chrono>
#include <functional>

#include <covenant/schema/primitives.hpp>

namespace covenant::common {

/// Millisecond wall clock. Injected everywhere a timestamp is recorded so
/// tests can pin time.
using clock_t = std::function<covenant::schema::timestamp_milliseconds_t()>;

inline covenant::schema::timestamp_milliseconds_t system_clock_milliseconds() {
  return static_cast<covenant::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace covenant::common
