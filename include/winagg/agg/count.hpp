#pragma once

#include <cstdint>

namespace winagg::agg {
// Number of records per pane, values are ignored
struct count {
  using acc_type = int64_t;

  acc_type init() const noexcept { return 0; }

  template <typename Value>
  void on_data(acc_type &acc, Value const &) const noexcept {
    ++acc;
  }
};
} // namespace winagg::agg
