#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <utility>

#include "agg/count.hpp"
#include "common.hpp"
#include "def.hpp"
#include "log.hpp"
#include "record.hpp"
#include "time_window.hpp"
#include "window_assigner.hpp"

namespace winagg {
enum class pane_phase {
  open,     ///< Accepting records
  complete, ///< Input exhausted, panes are final but not yet emitted
  emitted   ///< Panes handed to the emitter and discarded
};

/// Aggregation state identity: one pane per (window, key)
template <window_key Key>
struct pane_id {
  time_window window;
  Key key;

  friend bool operator==(pane_id const &, pane_id const &) = default;

  friend bool operator<(pane_id const &lhs, pane_id const &rhs) {
    if (lhs.window != rhs.window) {
      return lhs.window < rhs.window;
    }
    return lhs.key < rhs.key;
  }
};

/**
 * @brief Keyed event-time window aggregator
 *
 * Groups records by (window, key) and folds each record into the pane accumulator with the aggregation policy.
 *
 * Features:
 * - Fan-out: a record assigned to several windows (sliding) updates one pane per window
 * - Lazy panes: a pane exists only once a record fell into it, empty windows are never materialised
 * - Arrival order does not matter: assignment depends on the event time alone
 *
 * Usage:
 * 1. Construct with an assigner and, optionally, an aggregation policy (count by default)
 * 2. Feed records with accumulate()
 * 3. Hand the aggregator to a window_emitter and drain() it once the input is exhausted
 *
 * Not thread-safe.
 *
 * @tparam Key    Grouping key, must be totally ordered
 * @tparam Value  Record payload passed to the policy
 * @tparam Policy Aggregation policy, see agg::count, agg::sum, agg::functor
 */
template <window_key Key, typename Value, agg_policy<Value> Policy = agg::count>
class keyed_window_agg {
public:
  using key_type = Key;
  using value_type = Value;
  using policy_type = Policy;
  using acc_type = typename Policy::acc_type;
  using record_type = record<Key, Value>;
  using pane_type = pane_id<Key>;
  using pane_map = std::map<pane_type, acc_type>;

  explicit keyed_window_agg(window_assigner assigner, Policy policy = Policy{})
      : win_assigner(std::move(assigner)), policy(std::move(policy)), panes(), n_records(), state(pane_phase::open) {
    log::get()->debug("keyed window aggregator over {}", describe(win_assigner));
  }

  void accumulate(record_type const &r) { accumulate(r.key, r.value, r.event_time); }

  /**
   * @brief Fold one record into every pane its event time is assigned to
   *
   * @throws std::logic_error once the aggregator is sealed
   * @throws timestamp_out_of_range when the assigner cannot represent the windows of event_time, no pane is touched
   */

  void accumulate(Key const &key, Value const &value, timestamp event_time) {
    if (state != pane_phase::open) {
      throw std::logic_error("cannot accumulate into a sealed window aggregator");
    }

    for (auto const &w : winagg::assign(win_assigner, event_time)) {
      pane_type id{w, key};
      auto it = panes.lower_bound(id);
      if (it == panes.end() || panes.key_comp()(id, it->first)) {
        log::get()->trace("pane opened for window [{}, {})", w.start(), w.end());
        it = panes.emplace_hint(it, std::move(id), policy.init());
      }
      policy.on_data(it->second, value);
    }
    ++n_records;
  }

  /// Mark the input as exhausted. Panes become final; further records are rejected.
  void seal() noexcept {
    if (state == pane_phase::open) {
      state = pane_phase::complete;
    }
  }

  /// Seal and move every pane out. The aggregator keeps no state afterwards.
  pane_map take_panes() {
    seal();
    state = pane_phase::emitted;
    return std::exchange(panes, pane_map{});
  }

  acc_type const *find(time_window const &w, Key const &key) const {
    auto it = panes.find(pane_type{w, key});
    return it == panes.end() ? nullptr : &it->second;
  }

  pane_map const &state_view() const noexcept { return panes; }
  window_assigner const &assigner() const noexcept { return win_assigner; }
  pane_phase phase() const noexcept { return state; }

  size_t num_panes() const noexcept { return panes.size(); }
  size_t num_records() const noexcept { return n_records; }
  bool empty() const noexcept { return panes.empty(); }

private:
  window_assigner const win_assigner;
  WINAGG_NO_UNIQUE_ADDRESS Policy const policy;
  pane_map panes;
  size_t n_records;
  pane_phase state;
};
} // namespace winagg
