#pragma once
#include <type_traits>
#include <cstddef>
#include <cmath>

namespace fad {

//===========================
// Core value type
//===========================
// Primal value paired with its tangent w.r.t. the single seeded input.
template <class T>
struct Dual {
  using value_type = T;
  T value;
  T deriv;

  // Lifts a constant: tangent is zero
  constexpr Dual(const T& v) : value(v), deriv(T(0)) {}
  constexpr Dual(const T& v, const T& d) : value(v), deriv(d) {}
};

template <class T> constexpr Dual<T> lit(T c) { return Dual<T>(c, T(0)); }
template <class T> constexpr Dual<T> seed(T x) { return Dual<T>(x, T(1)); }

template <class T> struct is_dual : std::false_type {};
template <class T> struct is_dual<Dual<T>> : std::true_type {};

template <class T>
using is_dual_t = is_dual<std::decay_t<T>>;

template <class T>
constexpr bool operator==(const Dual<T>& a, const Dual<T>& b) {
  return a.value == b.value && a.deriv == b.deriv;
}
template <class T>
constexpr bool operator!=(const Dual<T>& a, const Dual<T>& b) { return !(a == b); }

//===========================
// Ops (tags)
//===========================
// Binary tags: eval(a, b) on primals, d(a, da, b, db) gives the result tangent.
// Unary tags:  eval(a) on the primal, d(a) gives g'(a); the chain rule is
//              applied once, in apply().
struct AddOp {
  static constexpr std::size_t arity = 2;
  template <class T> static constexpr T eval(const T& a, const T& b) { return a + b; }
  template <class T>
  static constexpr T d(const T&, const T& da, const T&, const T& db) { return da + db; }
};
struct SubOp {
  static constexpr std::size_t arity = 2;
  template <class T> static constexpr T eval(const T& a, const T& b) { return a - b; }
  template <class T>
  static constexpr T d(const T&, const T& da, const T&, const T& db) { return da - db; }
};
struct MulOp {
  static constexpr std::size_t arity = 2;
  template <class T> static constexpr T eval(const T& a, const T& b) { return a * b; }
  // product rule
  template <class T>
  static constexpr T d(const T& a, const T& da, const T& b, const T& db) { return da * b + a * db; }
};
struct SinOp {
  static constexpr std::size_t arity = 1;
  template <class T> static T eval(const T& a) { return std::sin(a); }
  template <class T> static T d(const T& a) { return std::cos(a); }
};
struct CosOp {
  static constexpr std::size_t arity = 1;
  template <class T> static T eval(const T& a) { return std::cos(a); }
  template <class T> static T d(const T& a) { return -std::sin(a); }
};
struct ExpOp {
  static constexpr std::size_t arity = 1;
  template <class T> static T eval(const T& a) { return std::exp(a); }
  template <class T> static T d(const T& a) { return std::exp(a); }
};
struct TanhOp {
  static constexpr std::size_t arity = 1;
  template <class T> static T eval(const T& a) { return std::tanh(a); }
  template <class T> static T d(const T& a) {
    const T t = std::tanh(a);
    return T(1) - t * t;
  }
};

//===========================
// Generic application
//===========================
template <class Op, class T>
constexpr Dual<T> apply(const Dual<T>& a) {
  static_assert(Op::arity == 1, "apply(a) needs a unary op tag");
  return Dual<T>(Op::eval(a.value), Op::d(a.value) * a.deriv);
}

template <class Op, class T>
constexpr Dual<T> apply(const Dual<T>& a, const Dual<T>& b) {
  static_assert(Op::arity == 2, "apply(a, b) needs a binary op tag");
  return Dual<T>(Op::eval(a.value, b.value), Op::d(a.value, a.deriv, b.value, b.deriv));
}

//===========================
// Operator sugar
//===========================
template <class T>
constexpr Dual<T> operator+(const Dual<T>& a, const Dual<T>& b) { return apply<AddOp>(a, b); }
template <class T>
constexpr Dual<T> operator-(const Dual<T>& a, const Dual<T>& b) { return apply<SubOp>(a, b); }
template <class T>
constexpr Dual<T> operator*(const Dual<T>& a, const Dual<T>& b) { return apply<MulOp>(a, b); }

template <class T>
constexpr Dual<T> operator-(const Dual<T>& a) { return Dual<T>(-a.value, -a.deriv); }

// Mixed dual/constant forms lift the constant first, so they agree exactly
// with the dual-dual operators. The scalar parameter is a non-deduced context
// so that e.g. `x * 2` converts the literal instead of failing deduction.
template <class T>
constexpr Dual<T> operator+(const Dual<T>& a, const typename Dual<T>::value_type& c) { return a + lit(c); }
template <class T>
constexpr Dual<T> operator-(const Dual<T>& a, const typename Dual<T>::value_type& c) { return a - lit(c); }
template <class T>
constexpr Dual<T> operator*(const Dual<T>& a, const typename Dual<T>::value_type& c) { return a * lit(c); }

template <class T>
constexpr Dual<T> operator+(const typename Dual<T>::value_type& c, const Dual<T>& a) { return lit(c) + a; }
template <class T>
constexpr Dual<T> operator-(const typename Dual<T>::value_type& c, const Dual<T>& a) { return lit(c) - a; }
template <class T>
constexpr Dual<T> operator*(const typename Dual<T>::value_type& c, const Dual<T>& a) { return lit(c) * a; }

// Math wrappers (only for Dual) -- plain scalars still resolve to std::sin etc.
template <class T> Dual<T> sin(const Dual<T>& a)  { return apply<SinOp>(a); }
template <class T> Dual<T> cos(const Dual<T>& a)  { return apply<CosOp>(a); }
template <class T> Dual<T> exp(const Dual<T>& a)  { return apply<ExpOp>(a); }
template <class T> Dual<T> tanh(const Dual<T>& a) { return apply<TanhOp>(a); }

} // namespace fad
