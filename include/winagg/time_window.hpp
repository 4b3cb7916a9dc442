#pragma once

#include <algorithm>
#include <compare>
#include <ostream>
#include <vector>

#include <fmt/format.h>

#include "common.hpp"
#include "errors.hpp"

namespace winagg {
/**
 * @brief Half-open event-time interval [start, end)
 *
 * Windows are left-closed, right-open. A record stamped exactly on a boundary belongs to the window that starts
 * there.
 *
 * | Window        | start   | end     | max_timestamp() |
 * |---------------|---------|---------|-----------------|
 * | [0s, 30s)     | 0       | 30000   | 29999           |
 * | [30s, 60s)    | 30000   | 60000   | 59999           |
 *
 * Windows compare by start, then by end.
 */
class time_window {
public:
  constexpr time_window(timestamp start, timestamp end) : win_start(start), win_end(end) {
    if (!(start < end)) {
      detail::config_error(fmt::format("window start {} must precede end {}", start, end));
    }
  }

  constexpr timestamp start() const noexcept { return win_start; }
  constexpr timestamp end() const noexcept { return win_end; }

  /// Latest timestamp inside the window; results of the window are stamped with it
  constexpr timestamp max_timestamp() const noexcept { return win_end - 1; }

  constexpr bool contains(timestamp t) const noexcept { return win_start <= t && t < win_end; }

  constexpr bool intersects(time_window const &other) const noexcept {
    return win_start < other.win_end && other.win_start < win_end;
  }

  /// Smallest window covering both
  constexpr time_window span(time_window const &other) const {
    return time_window(std::min(win_start, other.win_start), std::max(win_end, other.win_end));
  }

  friend constexpr bool operator==(time_window const &, time_window const &) noexcept = default;
  friend constexpr auto operator<=>(time_window const &, time_window const &) noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, time_window const &w) {
    return os << '[' << w.win_start << ", " << w.win_end << ')';
  }

private:
  timestamp win_start;
  timestamp win_end;
};

/// Windows a single timestamp belongs to, ascending by start, no duplicates
using window_set = std::vector<time_window>;
} // namespace winagg
