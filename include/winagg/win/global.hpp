#pragma once

#include <string>

#include "../common.hpp"
#include "../errors.hpp"
#include "../time_window.hpp"

namespace winagg::win {
// Single window [min_timestamp, max_timestamp) spanning the whole time line.
// max_timestamp itself falls outside and is rejected with timestamp_out_of_range.
class global {
public:
  static constexpr time_window window() noexcept { return {min_timestamp, max_timestamp}; }

  window_set assign(timestamp t) const {
    detail::check_event_time(t, min_event_time(), max_event_time(), "the global window");
    return {window()};
  }

  size_t max_windows() const noexcept { return 1; }

  timestamp min_event_time() const noexcept { return min_timestamp; }
  timestamp max_event_time() const noexcept { return max_timestamp - 1; }

  std::string describe() const { return "global"; }

  friend bool operator==(global const &, global const &) noexcept = default;
};
} // namespace winagg::win
