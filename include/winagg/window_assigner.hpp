#pragma once

#include <string>
#include <variant>

#include "common.hpp"
#include "time_window.hpp"
#include "win/fixed.hpp"
#include "win/global.hpp"
#include "win/sliding.hpp"

namespace winagg {
/**
 * @brief Window assignment policy
 *
 * Closed set of policies. Each alternative exposes:
 *
 * - assign(t): windows containing t, ascending by start, no duplicates, never an empty placeholder window.
 * - max_windows(): upper bound on the number of windows assign() returns.
 * - describe(): human readable summary.
 * - min_event_time(), max_event_time(): inclusive range of event times assign() accepts, it throws
 *   timestamp_out_of_range outside of it.
 *
 * Assigners are immutable and keep no per-record state, so one instance can be shared by any number of
 * aggregators.
 */
using window_assigner = std::variant<win::fixed, win::sliding, win::global>;

template <typename T>
concept assigner_policy = requires(T const &a, timestamp t) {
  { a.assign(t) } -> std::same_as<window_set>;
  { a.max_windows() } -> std::convertible_to<size_t>;
  { a.describe() } -> std::convertible_to<std::string>;
  { a.min_event_time() } -> std::same_as<timestamp>;
  { a.max_event_time() } -> std::same_as<timestamp>;
};

static_assert(assigner_policy<win::fixed>);
static_assert(assigner_policy<win::sliding>);
static_assert(assigner_policy<win::global>);

inline window_set assign(window_assigner const &assigner, timestamp t) {
  return std::visit([t](auto const &a) { return a.assign(t); }, assigner);
}

inline size_t max_windows(window_assigner const &assigner) noexcept {
  return std::visit([](auto const &a) { return a.max_windows(); }, assigner);
}

inline std::string describe(window_assigner const &assigner) {
  return std::visit([](auto const &a) { return a.describe(); }, assigner);
}
} // namespace winagg
