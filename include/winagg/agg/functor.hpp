#pragma once

#include <utility>

#include "../def.hpp"

namespace winagg::agg {
/**
 * @brief User supplied combine function
 *
 * Each pane starts from a copy of `initial` and folds records in with `fn(acc, value)`, which returns the new
 * accumulator.
 *
 * @code
 * auto longest = agg::functor(std::string{}, [](std::string acc, std::string const &v) {
 *   return v.size() > acc.size() ? v : acc;
 * });
 * @endcode
 */
template <typename Acc, typename Fn>
class functor {
public:
  using acc_type = Acc;

  functor(Acc initial, Fn fn) : initial(std::move(initial)), fn(std::move(fn)) {}

  acc_type init() const { return initial; }

  template <typename Value>
  void on_data(acc_type &acc, Value const &v) const {
    acc = fn(std::move(acc), v);
  }

private:
  Acc initial;
  WINAGG_NO_UNIQUE_ADDRESS Fn fn;
};

template <typename Acc, typename Fn>
functor(Acc, Fn) -> functor<Acc, Fn>;
} // namespace winagg::agg
