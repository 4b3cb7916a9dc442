#pragma once

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
 * @brief Fixed (tumbling) event-time windows
 *
 * Partitions the time line into non-overlapping windows of `size` milliseconds, shifted by `offset`.
 * Every timestamp belongs to exactly one window. The offset is normalised to [0, size).
 *
 * Example:
 *   size = 30s, offset = 0
 *   - t = 1000000 -> [990000, 1020000)
 *   - t = 1030001 -> [1020000, 1050000)
 *   - t = 1060000 -> [1050000, 1080000)
 *
 *   size = 30s, offset = 10001ms
 *   - t = 1000000 -> [970001, 1000001)
 *   - t = 1030001 -> [1030001, 1060001), t lies exactly on the boundary
 *
 * Event times are supported in [min_timestamp + size, max_timestamp - size], where every window bound is
 * representable. assign() throws timestamp_out_of_range outside of it.
 */
class fixed {
public:
  explicit fixed(millis size, millis offset = millis::zero()) : win_size(size.count()), win_offset() {
    if (win_size <= 0) {
      detail::config_error(fmt::format("fixed window size must be positive, got {}ms", win_size));
    }
    win_offset = detail::floor_mod(offset.count(), win_size);
    log::get()->debug("configured {}", describe());
  }

  window_set assign(timestamp t) const { return {window_of(t)}; }

  /// The single window containing t
  time_window window_of(timestamp t) const {
    detail::check_event_time(t, min_event_time(), max_event_time(), "fixed windows");
    // floor_mod(t - offset, size) without forming t - offset
    auto shift = detail::floor_mod(detail::floor_mod(t, win_size) - win_offset, win_size);
    auto start = t - shift;
    return {start, start + win_size};
  }

  timestamp size() const noexcept { return win_size; }
  timestamp offset() const noexcept { return win_offset; }
  size_t max_windows() const noexcept { return 1; }

  timestamp min_event_time() const noexcept { return min_timestamp + win_size; }
  timestamp max_event_time() const noexcept { return max_timestamp - win_size; }

  std::string describe() const { return fmt::format("fixed(size={}ms, offset={}ms)", win_size, win_offset); }

  friend bool operator==(fixed const &, fixed const &) noexcept = default;

private:
  timestamp win_size;   ///< Window length
  timestamp win_offset; ///< Normalised offset in [0, size)
};
} // namespace winagg::win
