// Exact rational arithmetic for beat and note durations.

#ifndef MTEXT_CORE_FRACTION_H
#define MTEXT_CORE_FRACTION_H

#include <cstdint>
#include <string>

namespace mtext {

/// @brief Reduced rational number with a positive denominator.
///
/// All rhythm durations are Fractions of a whole note. A zero denominator is
/// never stored: the constructor maps it to 0/1.
class Fraction {
 public:
  Fraction() = default;

  /// @brief Construct and reduce num/den.
  Fraction(int64_t num, int64_t den);

  int64_t num() const { return num_; }
  int64_t den() const { return den_; }

  bool isZero() const { return num_ == 0; }
  bool isPositive() const { return num_ > 0; }

  Fraction operator+(const Fraction& rhs) const;
  Fraction operator-(const Fraction& rhs) const;
  Fraction operator*(const Fraction& rhs) const;
  Fraction operator/(const Fraction& rhs) const;
  Fraction& operator+=(const Fraction& rhs);

  bool operator==(const Fraction& rhs) const { return num_ == rhs.num_ && den_ == rhs.den_; }
  bool operator!=(const Fraction& rhs) const { return !(*this == rhs); }
  bool operator<(const Fraction& rhs) const;
  bool operator<=(const Fraction& rhs) const { return !(rhs < *this); }
  bool operator>(const Fraction& rhs) const { return rhs < *this; }

  /// @brief Format as "num/den" ("1/4", "3/8").
  std::string toString() const;

 private:
  int64_t num_ = 0;
  int64_t den_ = 1;
};

/// @brief True if value is a positive power of two (1, 2, 4, 8 ...).
bool isPowerOfTwo(uint32_t value);

}  // namespace mtext

#endif  // MTEXT_CORE_FRACTION_H
