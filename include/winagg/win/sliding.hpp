#pragma once

#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "../chrono.hpp"
#include "../common.hpp"
#include "../errors.hpp"
#include "../log.hpp"
#include "../time_window.hpp"

#include "../detail/utils_math.hpp"

namespace winagg::win {
/**
 * @brief Sliding (hopping) event-time windows
 *
 * Windows of `size` milliseconds start every `period` milliseconds, on the lattice k * period + offset. A timestamp
 * belongs to every window of the lattice that contains it, so one record usually lands in several windows. When
 * period > size the lattice has gaps and a timestamp falling into one of them is assigned no window at all.
 *
 * Example:
 *   size = 20s, period = 12s, offset = 0
 *
 * | t        | windows                                      |
 * |----------|----------------------------------------------|
 * | 1000000  | [984000, 1004000), [996000, 1016000)         |
 * | 1030001  | [1020000, 1040000)                           |
 * | 1059999  | [1044000, 1064000), [1056000, 1076000)       |
 *
 * Windows are returned in ascending order of their start. Event times are supported in
 * [min_timestamp + size + period, max_timestamp - size]; assign() throws timestamp_out_of_range outside of it.
 */
class sliding {
public:
  sliding(millis size, millis period, millis offset = millis::zero())
      : win_size(size.count()), win_period(period.count()), win_offset() {
    if (win_size <= 0) {
      detail::config_error(fmt::format("sliding window size must be positive, got {}ms", win_size));
    }
    if (win_period <= 0) {
      detail::config_error(fmt::format("sliding window period must be positive, got {}ms", win_period));
    }
    win_offset = detail::floor_mod(offset.count(), win_period);
    log::get()->debug("configured {}", describe());
  }

  window_set assign(timestamp t) const {
    detail::check_event_time(t, min_event_time(), max_event_time(), "sliding windows");

    window_set windows;
    windows.reserve(max_windows());

    // Latest lattice start not after t, then walk back while the window still reaches t
    auto last_start = t - detail::floor_mod(detail::floor_mod(t, win_period) - win_offset, win_period);
    for (auto start = last_start; start > t - win_size; start -= win_period) {
      windows.emplace_back(start, start + win_size);
    }

    std::reverse(windows.begin(), windows.end());
    return windows;
  }

  timestamp size() const noexcept { return win_size; }
  timestamp period() const noexcept { return win_period; }
  timestamp offset() const noexcept { return win_offset; }

  /// Upper bound of windows per timestamp: ceil(size / period)
  size_t max_windows() const noexcept { return static_cast<size_t>(detail::ceil_div(win_size, win_period)); }

  // min_timestamp + size is at most -1, adding the period cannot overflow
  timestamp min_event_time() const noexcept { return min_timestamp + win_size + win_period; }
  timestamp max_event_time() const noexcept { return max_timestamp - win_size; }

  std::string describe() const {
    return fmt::format("sliding(size={}ms, period={}ms, offset={}ms)", win_size, win_period, win_offset);
  }

  friend bool operator==(sliding const &, sliding const &) noexcept = default;

private:
  timestamp win_size;   ///< Window length
  timestamp win_period; ///< Distance between consecutive window starts
  timestamp win_offset; ///< Normalised offset in [0, period)
};
} // namespace winagg::win
