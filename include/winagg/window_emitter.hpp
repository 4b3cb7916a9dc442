#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

#include "common.hpp"
#include "keyed_window_agg.hpp"
#include "log.hpp"
#include "time_window.hpp"

namespace winagg {
/**
 * @brief Materialised aggregate of one (window, key) pane
 *
 * output_time is the latest timestamp inside the window, i.e. window.end() - 1.
 */
template <typename Key, typename Acc>
struct window_result {
  time_window window;
  Key key;
  Acc value;
  timestamp output_time;

  friend bool operator==(window_result const &, window_result const &) = default;
};

/**
 * @brief Emits completed panes of a keyed window aggregator
 *
 * Completion follows the bounded input: every window is complete once the input is exhausted, there is no early
 * firing. A pane goes through OPEN -> COMPLETE -> EMITTED -> DISCARDED:
 *
 * | step            | aggregator phase | pane                                         |
 * |-----------------|------------------|----------------------------------------------|
 * | accumulate()    | open             | created on first record, updated afterwards  |
 * | drain() begins  | complete         | final, no record can reach it any more       |
 * | drain() returns | emitted          | handed out once, removed from the aggregator |
 *
 * Each (window, key) is emitted exactly once and windows nothing fell into are never emitted. Results come out in
 * (window, key) order, callers must not rely on it.
 *
 * @tparam Agg keyed_window_agg instantiation
 */
template <typename Agg>
class window_emitter {
public:
  using key_type = typename Agg::key_type;
  using acc_type = typename Agg::acc_type;
  using result_type = window_result<key_type, acc_type>;

  explicit window_emitter(Agg &aggregator) noexcept : aggr(aggregator), n_emitted() {}

  std::vector<result_type> drain() {
    std::vector<result_type> out;
    out.reserve(aggr.num_panes());
    drain([&out](result_type &&r) { out.push_back(std::move(r)); });
    return out;
  }

  /**
   * @brief Push every completed pane into a sink
   *
   * The panes leave the aggregator before the first push. If the sink throws, the exception propagates, the
   * results pushed so far are counted in num_emitted() and the panes not yet pushed are dropped.
   *
   * @param sink callable taking a result_type rvalue
   * @return number of results pushed
   */
  template <std::invocable<result_type &&> Sink>
  size_t drain(Sink &&sink) {
    auto panes = aggr.take_panes();
    size_t n = 0;
    for (auto &[id, acc] : panes) {
      auto out_time = id.window.max_timestamp();
      std::invoke(sink, result_type{id.window, id.key, std::move(acc), out_time});
      ++n;
      ++n_emitted;
    }
    log::get()->debug("drained {} panes ({} records accumulated)", n, aggr.num_records());
    return n;
  }

  size_t num_emitted() const noexcept { return n_emitted; }

private:
  Agg &aggr;
  size_t n_emitted;
};
} // namespace winagg
