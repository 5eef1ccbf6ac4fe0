// Tests for render/duration.h -- standard values, dots and tie chains.

#include "render/duration.h"

#include <gtest/gtest.h>

#include <vector>

namespace mtext {
namespace {

TEST(StandardDurationTest, PlainValues) {
  DurationPart part;
  ASSERT_TRUE(standardDuration(Fraction(1, 4), part));
  EXPECT_EQ(part, (DurationPart{4, 0}));
  ASSERT_TRUE(standardDuration(Fraction(1, 1), part));
  EXPECT_EQ(part.denominator, 1u);
  ASSERT_TRUE(standardDuration(Fraction(1, 64), part));
  EXPECT_EQ(part.denominator, 64u);
}

TEST(StandardDurationTest, DottedValues) {
  DurationPart part;
  ASSERT_TRUE(standardDuration(Fraction(3, 8), part));
  EXPECT_EQ(part, (DurationPart{4, 1}));
  ASSERT_TRUE(standardDuration(Fraction(7, 16), part));
  EXPECT_EQ(part, (DurationPart{4, 2}));
  ASSERT_TRUE(standardDuration(Fraction(3, 64), part));
  EXPECT_EQ(part, (DurationPart{32, 1}));
}

TEST(StandardDurationTest, RejectsIrregular) {
  DurationPart part;
  EXPECT_FALSE(standardDuration(Fraction(5, 16), part));
  EXPECT_FALSE(standardDuration(Fraction(1, 3), part));
  EXPECT_FALSE(standardDuration(Fraction(0, 1), part));
}

TEST(DecomposeDurationTest, SingleStandardPart) {
  std::vector<DurationPart> parts = decomposeDuration(Fraction(3, 16));
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], (DurationPart{8, 1}));
}

TEST(DecomposeDurationTest, GreedyTieChain) {
  std::vector<DurationPart> parts = decomposeDuration(Fraction(5, 16));
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], (DurationPart{4, 0}));
  EXPECT_EQ(parts[1], (DurationPart{16, 0}));

  parts = decomposeDuration(Fraction(5, 4));
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0].denominator, 1u);
  EXPECT_EQ(parts[1].denominator, 4u);
}

TEST(DecomposeDurationTest, ZeroIsEmpty) {
  EXPECT_TRUE(decomposeDuration(Fraction(0, 1)).empty());
}

TEST(DecomposeDurationTest, ShorterThanSixtyFourthKeepsOnePart) {
  std::vector<DurationPart> parts = decomposeDuration(Fraction(1, 256));
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], (DurationPart{64, 0}));

  parts = decomposeDuration(Fraction(1, 128));
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], (DurationPart{64, 0}));
}

TEST(DecomposeDurationTest, TailRoundsUpToSixtyFourth) {
  // 33/128 = 1/4 + 1/128.
  std::vector<DurationPart> parts = decomposeDuration(Fraction(33, 128));
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], (DurationPart{4, 0}));
  EXPECT_EQ(parts[1], (DurationPart{64, 0}));

  // 127/512 rounds up to a plain quarter.
  parts = decomposeDuration(Fraction(127, 512));
  ASSERT_EQ(parts.size(), 1u);
  EXPECT_EQ(parts[0], (DurationPart{4, 0}));

  // 1/3 is not a finite sum of binary values.
  Fraction total(0, 1);
  for (const auto& part : decomposeDuration(Fraction(1, 3))) total += durationPartValue(part);
  EXPECT_EQ(total, Fraction(11, 32));
}

TEST(DurationStringTest, LilypondAndVexflow) {
  EXPECT_EQ(lilypondDurationString(DurationPart{4, 0}), "4");
  EXPECT_EQ(lilypondDurationString(DurationPart{8, 1}), "8.");
  EXPECT_EQ(lilypondDurationString(DurationPart{2, 2}), "2..");
  EXPECT_EQ(vexflowDurationCode(DurationPart{1, 0}), "w");
  EXPECT_EQ(vexflowDurationCode(DurationPart{2, 1}), "h");
  EXPECT_EQ(vexflowDurationCode(DurationPart{4, 0}), "q");
  EXPECT_EQ(vexflowDurationCode(DurationPart{16, 0}), "16");
}

TEST(DurationPartValueTest, Dots) {
  EXPECT_EQ(durationPartValue(DurationPart{2, 0}), Fraction(1, 2));
  EXPECT_EQ(durationPartValue(DurationPart{2, 1}), Fraction(3, 4));
  EXPECT_EQ(durationPartValue(DurationPart{2, 2}), Fraction(7, 8));
}

}  // namespace
}  // namespace mtext
