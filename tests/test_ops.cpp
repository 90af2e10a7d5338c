#include <algorithm>
#include <cassert>
#include <cmath>

#include "fad/dual.hpp"
#include "fad/deriv.hpp"

using namespace fad;

static bool approx(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps * (1.0 + std::max(std::fabs(a), std::fabs(b)));
}

template <class F>
static double fd1(const F& f, double x, double h = 1e-6) {
  double f1 = f(x + h);
  double f2 = f(x - h);
  return (f1 - f2) / (2*h);
}

// A user-defined elementary function: only eval and d are supplied
struct CubeOp {
  static constexpr std::size_t arity = 1;
  template <class T> static constexpr T eval(const T& a) { return a * a * a; }
  template <class T> static constexpr T d(const T& a) { return T(3) * a * a; }
};

int main() {
  // sin: d/dx sin(x) = cos(x); cos: d/dx cos(x) = -sin(x)
  {
    auto s = [](Dual<double> x) { return sin(x); };
    auto c = [](Dual<double> x) { return cos(x); };
    const double xs[] = {-2.1, 0.0, 0.8, 3.0};
    for (double xv : xs) {
      assert(evaluate(s, xv) == std::sin(xv));
      assert(evaluate(c, xv) == std::cos(xv));
      assert(deriv(s)(xv) == std::cos(xv));
      assert(deriv(c)(xv) == -std::sin(xv));
      auto sf = [&](double v){ return evaluate(s, v); };
      auto cf = [&](double v){ return evaluate(c, v); };
      assert(approx(deriv(s)(xv), fd1(sf, xv), 1e-6));
      assert(approx(deriv(c)(xv), fd1(cf, xv), 1e-6));
    }
  }

  // Tangent is scaled by the incoming derivative
  {
    Dual<double> u(0.7, 2.5);
    assert(sin(u).deriv == std::cos(0.7) * 2.5);
    assert(cos(u).deriv == -std::sin(0.7) * 2.5);
    assert(sin(lit(0.7)).deriv == 0.0);
    assert(cos(lit(0.7)).deriv == 0.0);
  }

  // exp: d/dx exp(x) = exp(x)
  {
    auto e = [](Dual<double> x) { return exp(x); };
    double xv = 0.3;
    assert(approx(evaluate(e, xv), std::exp(xv)));
    assert(approx(deriv(e)(xv), std::exp(xv)));
    auto ef = [&](double v){ return evaluate(e, v); };
    assert(approx(deriv(e)(xv), fd1(ef, xv), 1e-6));
  }

  // tanh: d/dx tanh(x) = 1 - tanh(x)^2
  {
    auto t = [](Dual<double> x) { return tanh(x); };
    double xv = -0.9;
    double th = std::tanh(xv);
    assert(approx(evaluate(t, xv), th));
    assert(approx(deriv(t)(xv), 1.0 - th * th));
    auto tf = [&](double v){ return evaluate(t, v); };
    assert(approx(deriv(t)(xv), fd1(tf, xv), 1e-6));
  }

  // Custom op tag goes through the same chain rule
  {
    auto g = [](Dual<double> x) { return apply<CubeOp>(sin(x)); };
    double xv = 1.1;
    double s = std::sin(xv);
    assert(approx(evaluate(g, xv), s * s * s));
    assert(approx(deriv(g)(xv), 3.0 * s * s * std::cos(xv)));
    auto gf = [&](double v){ return evaluate(g, v); };
    assert(approx(deriv(g)(xv), fd1(gf, xv), 1e-6));
  }

  // Composition: sin(x)cos(x) + exp(-x*x) - tanh(3x)
  {
    auto f = [](Dual<double> x) { return sin(x) * cos(x) + exp(-x * x) - tanh(3.0 * x); };
    auto df_exact = [](double x) {
      double t = std::tanh(3.0 * x);
      return std::cos(x) * std::cos(x) - std::sin(x) * std::sin(x)
             - 2.0 * x * std::exp(-x * x)
             - 3.0 * (1.0 - t * t);
    };
    auto df = deriv(f);
    auto ff = [&](double v){ return evaluate(f, v); };
    const double xs[] = {-1.7, -0.2, 0.0, 0.45, 2.3};
    for (double xv : xs) {
      assert(approx(df(xv), df_exact(xv)));
      assert(approx(df(xv), fd1(ff, xv), 1e-6));
    }
  }

  // Scalar math still resolves to <cmath>
  {
    double v = sin(0.5) + cos(0.5);
    assert(v == std::sin(0.5) + std::cos(0.5));
  }

  return 0;
}
