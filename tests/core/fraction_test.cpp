// Tests for core/fraction.h -- reduction, arithmetic and ordering.

#include "core/fraction.h"

#include <gtest/gtest.h>

namespace mtext {
namespace {

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

TEST(FractionTest, DefaultIsZero) {
  Fraction frac;
  EXPECT_TRUE(frac.isZero());
  EXPECT_EQ(frac.num(), 0);
  EXPECT_EQ(frac.den(), 1);
}

TEST(FractionTest, ReducesOnConstruction) {
  Fraction frac(6, 8);
  EXPECT_EQ(frac.num(), 3);
  EXPECT_EQ(frac.den(), 4);
}

TEST(FractionTest, NegativeDenominatorMovesSign) {
  Fraction frac(1, -4);
  EXPECT_EQ(frac.num(), -1);
  EXPECT_EQ(frac.den(), 4);
  EXPECT_FALSE(frac.isPositive());
}

TEST(FractionTest, ZeroDenominatorBecomesZero) {
  Fraction frac(5, 0);
  EXPECT_TRUE(frac.isZero());
  EXPECT_EQ(frac.den(), 1);
}

TEST(FractionTest, ZeroNumeratorNormalizes) {
  Fraction frac(0, 12);
  EXPECT_EQ(frac, Fraction(0, 1));
}

// ---------------------------------------------------------------------------
// Arithmetic
// ---------------------------------------------------------------------------

TEST(FractionTest, Addition) {
  EXPECT_EQ(Fraction(1, 8) + Fraction(1, 8), Fraction(1, 4));
  EXPECT_EQ(Fraction(1, 12) + Fraction(1, 6), Fraction(1, 4));
}

TEST(FractionTest, Subtraction) {
  EXPECT_EQ(Fraction(1, 4) - Fraction(1, 8), Fraction(1, 8));
  EXPECT_EQ(Fraction(1, 8) - Fraction(1, 4), Fraction(-1, 8));
}

TEST(FractionTest, MultiplyAndDivide) {
  EXPECT_EQ(Fraction(2, 3) * Fraction(1, 4), Fraction(1, 6));
  EXPECT_EQ(Fraction(1, 4) / Fraction(2, 1), Fraction(1, 8));
}

TEST(FractionTest, CompoundAssign) {
  Fraction total;
  for (int idx = 0; idx < 3; ++idx) total += Fraction(1, 12);
  EXPECT_EQ(total, Fraction(1, 4));
}

TEST(FractionTest, Ordering) {
  EXPECT_LT(Fraction(1, 8), Fraction(1, 4));
  EXPECT_GT(Fraction(3, 8), Fraction(1, 4));
  EXPECT_LE(Fraction(2, 8), Fraction(1, 4));
  EXPECT_FALSE(Fraction(1, 4) < Fraction(1, 4));
}

TEST(FractionTest, ToString) {
  EXPECT_EQ(Fraction(3, 8).toString(), "3/8");
  EXPECT_EQ(Fraction(4, 16).toString(), "1/4");
  EXPECT_EQ(Fraction(2, 1).toString(), "2/1");
}

// ---------------------------------------------------------------------------
// isPowerOfTwo
// ---------------------------------------------------------------------------

TEST(PowerOfTwoTest, Values) {
  EXPECT_FALSE(isPowerOfTwo(0));
  EXPECT_TRUE(isPowerOfTwo(1));
  EXPECT_TRUE(isPowerOfTwo(2));
  EXPECT_FALSE(isPowerOfTwo(3));
  EXPECT_TRUE(isPowerOfTwo(8));
  EXPECT_FALSE(isPowerOfTwo(12));
  EXPECT_TRUE(isPowerOfTwo(64));
}

}  // namespace
}  // namespace mtext
