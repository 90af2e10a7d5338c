#pragma once
#include <ostream>

#include "fad/dual.hpp"

namespace fad {

// Prints "(value, deriv)"
template <class T>
std::ostream& operator<<(std::ostream& os, const Dual<T>& d) {
  return os << '(' << d.value << ", " << d.deriv << ')';
}

} // namespace fad
