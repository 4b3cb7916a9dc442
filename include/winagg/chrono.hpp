#pragma once

#include <chrono>

#include "common.hpp"

namespace winagg {
using millis = std::chrono::milliseconds;

/// Convert any std::chrono duration to a millisecond count, truncating sub-millisecond parts
template <typename Rep, typename Period>
constexpr timestamp to_millis(std::chrono::duration<Rep, Period> d) noexcept {
  return std::chrono::duration_cast<millis>(d).count();
}

/// Event time of a clock time point, in milliseconds since the clock epoch
template <typename Clock, typename Duration>
constexpr timestamp to_timestamp(std::chrono::time_point<Clock, Duration> tp) noexcept {
  return to_millis(tp.time_since_epoch());
}
} // namespace winagg
