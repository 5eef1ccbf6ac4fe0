/// @file
/// @brief Fraction reduction and arithmetic.

#include "core/fraction.h"

#include <cstdlib>

namespace mtext {

namespace {

int64_t gcd(int64_t lhs, int64_t rhs) {
  lhs = std::llabs(lhs);
  rhs = std::llabs(rhs);
  while (rhs != 0) {
    int64_t tmp = lhs % rhs;
    lhs = rhs;
    rhs = tmp;
  }
  return lhs;
}

}  // namespace

Fraction::Fraction(int64_t num, int64_t den) {
  if (den == 0) {
    num_ = 0;
    den_ = 1;
    return;
  }
  if (den < 0) {
    num = -num;
    den = -den;
  }
  int64_t divisor = gcd(num, den);
  if (divisor == 0) divisor = 1;
  num_ = num / divisor;
  den_ = den / divisor;
}

Fraction Fraction::operator+(const Fraction& rhs) const {
  return Fraction(num_ * rhs.den_ + rhs.num_ * den_, den_ * rhs.den_);
}

Fraction Fraction::operator-(const Fraction& rhs) const {
  return Fraction(num_ * rhs.den_ - rhs.num_ * den_, den_ * rhs.den_);
}

Fraction Fraction::operator*(const Fraction& rhs) const {
  return Fraction(num_ * rhs.num_, den_ * rhs.den_);
}

Fraction Fraction::operator/(const Fraction& rhs) const {
  return Fraction(num_ * rhs.den_, den_ * rhs.num_);
}

Fraction& Fraction::operator+=(const Fraction& rhs) {
  *this = *this + rhs;
  return *this;
}

bool Fraction::operator<(const Fraction& rhs) const {
  // Denominators are positive, so cross-multiplication keeps the order.
  return num_ * rhs.den_ < rhs.num_ * den_;
}

std::string Fraction::toString() const {
  return std::to_string(num_) + "/" + std::to_string(den_);
}

bool isPowerOfTwo(uint32_t value) {
  return value != 0 && (value & (value - 1)) == 0;
}

}  // namespace mtext
