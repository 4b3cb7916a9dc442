#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <type_traits>

namespace winagg {
using timestamp = int64_t; ///< Milliseconds since the Unix epoch

constexpr inline timestamp min_timestamp = std::numeric_limits<timestamp>::min();
constexpr inline timestamp max_timestamp = std::numeric_limits<timestamp>::max();

// Concepts

template <typename T>
concept arithmetic = std::is_arithmetic_v<T>;

// Keys are grouped through an ordered map
template <typename K>
concept window_key = std::totally_ordered<K> && std::copy_constructible<K>;

/**
 * @brief Aggregation policy
 *
 * A policy owns no per-pane state. It creates an accumulator with init() and folds one value into it with
 * on_data(). The aggregator keeps one accumulator per (window, key) pane.
 */
template <typename P, typename V>
concept agg_policy = requires(P const &p, typename P::acc_type &acc, V const &v) {
  typename P::acc_type;
  { p.init() } -> std::convertible_to<typename P::acc_type>;
  { p.on_data(acc, v) };
};

template <typename F, typename Raw>
concept time_extractor = std::invocable<F const &, Raw const &> &&
                         std::convertible_to<std::invoke_result_t<F const &, Raw const &>, timestamp>;

template <typename F, typename Raw>
concept key_extractor =
    std::invocable<F const &, Raw const &> && window_key<std::decay_t<std::invoke_result_t<F const &, Raw const &>>>;

template <typename F, typename Raw>
using extract_result_t = std::decay_t<std::invoke_result_t<F const &, Raw const &>>;
} // namespace winagg
