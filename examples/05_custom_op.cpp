#include <cmath>
#include <iostream>
#include "fad/dual.hpp"
#include "fad/deriv.hpp"
#include "fad/io.hpp"

// Logistic sigmoid s(a) = 1 / (1 + exp(-a)), s'(a) = s(a) * (1 - s(a))
struct SigmoidOp {
  static constexpr std::size_t arity = 1;
  template <class T> static T eval(const T& a) { return T(1) / (T(1) + std::exp(-a)); }
  template <class T> static T d(const T& a) {
    const T s = eval(a);
    return s * (T(1) - s);
  }
};

int main() {
  using namespace fad;
  auto f = [](Dual<double> x) { return apply<SigmoidOp>(2.0 * x - 1.0); };

  std::cout << "f(x) = sigmoid(2x - 1)\n";
  for (double x : {-1.0, 0.0, 0.5, 2.0})
    std::cout << "(f, f') at " << x << " = " << value_and_deriv(f, x) << "\n";
  return 0;
}
