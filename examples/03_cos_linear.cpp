#include <cmath>
#include <iostream>
#include "fad/dual.hpp"
#include "fad/deriv.hpp"

int main() {
  using namespace fad;
  const double pi = std::acos(-1.0);
  auto f = [](Dual<double> x) { return 3.0 * cos(x) - x; };
  auto df = deriv(f);

  std::cout << "f(x) = 3*cos(x) - x\n";
  for (double x : {pi, 0.0}) {
    std::cout << "f(" << x << ")  = " << evaluate(f, x) << "\n";
    std::cout << "f'(" << x << ") = " << df(x) << "\n";
  }
  return 0;
}
