#pragma once

#include <functional>
#include <ranges>
#include <utility>
#include <vector>

#include "agg/count.hpp"
#include "common.hpp"
#include "keyed_window_agg.hpp"
#include "window_assigner.hpp"
#include "window_emitter.hpp"

namespace winagg::windowed {
namespace detail {
struct identity_value {
  template <typename T>
  T const &operator()(T const &v) const noexcept {
    return v;
  }
};
} // namespace detail

/**
 * @brief One bounded pass: window, key, aggregate, emit
 *
 * Every raw item is stamped with time_of(raw), keyed with key_of(raw) and its value_of(raw) is folded into the
 * panes of its windows. After the source is exhausted all panes are drained.
 *
 * Exceptions thrown by the extractors propagate unchanged and abort the pass.
 */
template <std::ranges::input_range R, typename KeyFn, typename TimeFn, typename ValueFn, typename Policy>
  requires key_extractor<KeyFn, std::ranges::range_value_t<R>> &&
           time_extractor<TimeFn, std::ranges::range_value_t<R>> &&
           std::invocable<ValueFn const &, std::ranges::range_value_t<R> const &>
auto run(R &&source, window_assigner assigner, KeyFn const &key_of, TimeFn const &time_of, ValueFn const &value_of,
         Policy policy) {
  using raw_type = std::ranges::range_value_t<R>;
  using key_type = extract_result_t<KeyFn, raw_type>;
  using value_type = extract_result_t<ValueFn, raw_type>;
  using agg_type = keyed_window_agg<key_type, value_type, Policy>;

  agg_type aggr(std::move(assigner), std::move(policy));
  for (auto const &raw : source) {
    timestamp t = std::invoke(time_of, raw);
    aggr.accumulate(std::invoke(key_of, raw), std::invoke(value_of, raw), t);
  }

  window_emitter<agg_type> emitter(aggr);
  return emitter.drain();
}

template <std::ranges::input_range R, typename KeyFn, typename TimeFn, typename ValueFn>
auto run(R &&source, window_assigner assigner, KeyFn const &key_of, TimeFn const &time_of, ValueFn const &value_of) {
  return run(std::forward<R>(source), std::move(assigner), key_of, time_of, value_of, agg::count{});
}

/// Number of items per (window, key)
template <std::ranges::input_range R, typename KeyFn, typename TimeFn>
auto count_per_key(R &&source, window_assigner assigner, KeyFn const &key_of, TimeFn const &time_of) {
  return run(std::forward<R>(source), std::move(assigner), key_of, time_of, detail::identity_value{}, agg::count{});
}
} // namespace winagg::windowed
