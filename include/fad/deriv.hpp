#pragma once
#include <type_traits>
#include <utility>

#include "fad/dual.hpp"

namespace fad {

//===========================
// Derivative driver
//===========================
template <class F, class T>
using dual_result_t = decltype(std::declval<const F&>()(std::declval<Dual<T>>()));

// f(seed(x)): value and derivative from one forward sweep
template <class F, class T>
constexpr Dual<T> value_and_deriv(const F& f, const T& x) {
  static_assert(is_dual_t<dual_result_t<F, T>>::value,
                "f must map Dual<T> to Dual<T>");
  return f(seed(x));
}

// Plain value path: the input is lifted as a constant (tangent 0)
template <class F, class T>
constexpr T evaluate(const F& f, const T& x) {
  static_assert(is_dual_t<dual_result_t<F, T>>::value,
                "f must map Dual<T> to Dual<T>");
  return f(lit(x)).value;
}

// deriv(f) -> x |-> f'(x)
template <class T = double, class F>
constexpr auto deriv(F f) {
  return [f = std::move(f)](const T& x) -> T { return value_and_deriv(f, x).deriv; };
}

} // namespace fad
