#include <iostream>
#include "fad/dual.hpp"
#include "fad/deriv.hpp"

int main() {
  using namespace fad;
  auto f = [](Dual<double> x) { return x * x; };
  auto df = deriv(f);

  std::cout << "f(x) = x*x\n";
  std::cout << "f(3)  = " << evaluate(f, 3.0) << "\n";
  std::cout << "f'(3) = " << df(3.0) << "\n";
  std::cout << "f'(5) = " << df(5.0) << "\n";
  return 0;
}
