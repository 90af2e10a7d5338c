#include <iostream>
#include "fad/dual.hpp"
#include "fad/deriv.hpp"
#include "fad/io.hpp"

int main() {
  using namespace fad;
  auto f = [](Dual<double> x) { return x * x + 2.0 * x + 1.0; };
  auto df = deriv(f);

  std::cout << "f(x) = x*x + 2*x + 1\n";
  std::cout << "f(1)  = " << evaluate(f, 1.0) << "\n";
  std::cout << "f'(1) = " << df(1.0) << "\n";
  std::cout << "f'(5) = " << df(5.0) << "\n";
  std::cout << "(f, f') at 5 = " << value_and_deriv(f, 5.0) << "\n";
  return 0;
}
