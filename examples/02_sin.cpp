#include <cmath>
#include <iostream>
#include "fad/dual.hpp"
#include "fad/deriv.hpp"

int main() {
  using namespace fad;
  const double pi = std::acos(-1.0);
  auto f = [](Dual<double> x) { return sin(x); };
  auto df = deriv(f);

  std::cout << "f(x) = sin(x)\n";
  std::cout << "f(pi/2)  = " << evaluate(f, pi / 2) << "\n";
  // cos(pi/2) comes out as ~6.1e-17 rather than 0
  std::cout << "f'(pi/2) = " << df(pi / 2) << "\n";
  std::cout << "f'(0)    = " << df(0.0) << "\n";
  return 0;
}
