#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "common.hpp"
#include "log.hpp"

namespace winagg {
/// Window configuration rejected at construction: non-positive size or period, or an inverted window
class invalid_config : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// Event time too close to the int64 limits for its windows to be represented
class timestamp_out_of_range : public std::out_of_range {
public:
  timestamp_out_of_range(std::string const &what, timestamp t) : std::out_of_range(what), event_time(t) {}

  timestamp when() const noexcept { return event_time; }

private:
  timestamp event_time;
};

namespace detail {
[[noreturn]] inline void config_error(std::string const &what) {
  log::get()->error("invalid window configuration: {}", what);
  throw invalid_config(what);
}

// Throws timestamp_out_of_range unless t lies in [lo, hi]
inline void check_event_time(timestamp t, timestamp lo, timestamp hi, std::string_view assigner) {
  if (t < lo || t > hi) {
    auto what = fmt::format("event time {} outside the range [{}, {}] supported by {}", t, lo, hi, assigner);
    log::get()->error("{}", what);
    throw timestamp_out_of_range(what, t);
  }
}
} // namespace detail
} // namespace winagg
