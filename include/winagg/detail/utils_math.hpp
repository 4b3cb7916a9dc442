#pragma once

#include <cassert>
#include <concepts>

namespace winagg::detail {
// Division rounding towards negative infinity, b > 0
template <std::signed_integral T>
constexpr T floor_div(T a, T b) noexcept {
  assert(b > 0 && "divisor must be positive");
  T q = a / b;
  if ((a % b) < 0) {
    --q;
  }
  return q;
}

// Remainder with the sign of the divisor, result in [0, b) for b > 0
template <std::signed_integral T>
constexpr T floor_mod(T a, T b) noexcept {
  assert(b > 0 && "divisor must be positive");
  T r = a % b;
  return r < 0 ? r + b : r;
}

template <std::signed_integral T>
constexpr T ceil_div(T a, T b) noexcept {
  assert(b > 0 && "divisor must be positive");
  return -floor_div(-a, b);
}
} // namespace winagg::detail
