#pragma once

#include <utility>

#include "common.hpp"

namespace winagg {
/**
 * @brief Keyed record stamped with its event time
 *
 * The event time is assigned before the record reaches an aggregator and may differ from arrival order. Windowing
 * only ever looks at event_time.
 */
template <typename Key, typename Value>
struct record {
  Key key;
  Value value;
  timestamp event_time;

  friend bool operator==(record const &, record const &) = default;
};

template <typename Key, typename Value>
record<Key, Value> make_record(Key key, Value value, timestamp event_time) {
  return {std::move(key), std::move(value), event_time};
}
} // namespace winagg
