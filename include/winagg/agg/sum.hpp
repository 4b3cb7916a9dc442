#pragma once

#include "../common.hpp"

namespace winagg::agg {
template <arithmetic T>
struct sum {
  using acc_type = T;

  acc_type init() const noexcept { return acc_type{}; }

  template <typename Value>
  void on_data(acc_type &acc, Value const &v) const noexcept {
    acc += static_cast<acc_type>(v);
  }
};
} // namespace winagg::agg
