#pragma once

#include <chrono>
#include <string_view>

#include <fmt/format.h>

#include "chrono.hpp"
#include "errors.hpp"
#include "window_assigner.hpp"

namespace winagg {
enum class window_kind { fixed, sliding, global };

constexpr std::string_view to_string(window_kind kind) noexcept {
  switch (kind) {
  case window_kind::fixed:
    return "fixed";
  case window_kind::sliding:
    return "sliding";
  case window_kind::global:
    return "global";
  }
  return "unknown";
}

/**
 * @brief Window configuration
 *
 * Collects window parameters before an assigner is built. Durations of any std::chrono unit are accepted and
 * truncated to milliseconds.
 *
 * @code
 * auto opts = sliding_windows(std::chrono::seconds(30)).every(std::chrono::seconds(15));
 * window_assigner assigner = make_assigner(opts);
 * @endcode
 */
struct window_options {
  window_kind kind = window_kind::global;
  millis size = millis::zero();
  millis period = millis::zero();
  millis offset = millis::zero();

  template <typename Rep, typename Period>
  window_options &of(std::chrono::duration<Rep, Period> const &length) {
    size = std::chrono::duration_cast<millis>(length);
    return *this;
  }

  // Sliding period, turns fixed options into sliding ones
  template <typename Rep, typename Period>
  window_options &every(std::chrono::duration<Rep, Period> const &interval) {
    period = std::chrono::duration_cast<millis>(interval);
    if (kind == window_kind::fixed) {
      kind = window_kind::sliding;
    }
    return *this;
  }

  template <typename Rep, typename Period>
  window_options &with_offset(std::chrono::duration<Rep, Period> const &shift) {
    offset = std::chrono::duration_cast<millis>(shift);
    return *this;
  }

  // Throws invalid_config if no assigner can be built from these options
  void validate() const {
    if (kind == window_kind::global) {
      // Parameters set on a global window mean the kind was never chosen
      if (size != millis::zero() || period != millis::zero() || offset != millis::zero()) {
        detail::config_error(fmt::format("global window takes no size, period or offset, got {}ms, {}ms, {}ms",
                                         size.count(), period.count(), offset.count()));
      }
      return;
    }
    if (size <= millis::zero()) {
      detail::config_error(fmt::format("{} window size must be positive, got {}ms", to_string(kind), size.count()));
    }
    if (kind == window_kind::sliding && period <= millis::zero()) {
      detail::config_error(fmt::format("sliding window period must be positive, got {}ms", period.count()));
    }
  }
};

template <typename Rep, typename Period>
window_options fixed_windows(std::chrono::duration<Rep, Period> const &size) {
  window_options opts;
  opts.kind = window_kind::fixed;
  opts.of(size);
  return opts;
}

template <typename Rep, typename Period>
window_options sliding_windows(std::chrono::duration<Rep, Period> const &size) {
  window_options opts;
  opts.kind = window_kind::sliding;
  opts.of(size);
  // A period equal to the size degenerates to fixed windows until every() says otherwise
  opts.period = opts.size;
  return opts;
}

template <typename Rep1, typename Period1, typename Rep2, typename Period2>
window_options sliding_windows(std::chrono::duration<Rep1, Period1> const &size,
                               std::chrono::duration<Rep2, Period2> const &period) {
  return sliding_windows(size).every(period);
}

inline window_options global_window() { return {}; }

inline window_assigner make_assigner(window_options const &opts) {
  opts.validate();
  switch (opts.kind) {
  case window_kind::fixed:
    return win::fixed(opts.size, opts.offset);
  case window_kind::sliding:
    return win::sliding(opts.size, opts.period, opts.offset);
  case window_kind::global:
    break;
  }
  return win::global{};
}
} // namespace winagg
