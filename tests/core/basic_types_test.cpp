// Tests for core/basic_types.h -- enum conversions and barline parsing.

#include "core/basic_types.h"

#include <gtest/gtest.h>

#include <string>

namespace mtext {
namespace {

// ---------------------------------------------------------------------------
// Constants and Position
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, AssignDistance) {
  EXPECT_EQ(kMaxAssignDistance, 5u);
}

TEST(BasicTypesTest, PositionEquality) {
  Position lhs{1, 4, 20};
  Position rhs{1, 4, 20};
  EXPECT_EQ(lhs, rhs);
  rhs.char_index = 21;
  EXPECT_NE(lhs, rhs);
}

TEST(BasicTypesTest, PositionDefaultsToOrigin) {
  Position pos;
  EXPECT_EQ(pos.row, 0u);
  EXPECT_EQ(pos.col, 0u);
  EXPECT_EQ(pos.char_index, 0u);
}

// ---------------------------------------------------------------------------
// String conversions
// ---------------------------------------------------------------------------

TEST(BasicTypesTest, NotationSystemToString) {
  EXPECT_STREQ(notationSystemToString(NotationSystem::Number), "number");
  EXPECT_STREQ(notationSystemToString(NotationSystem::Western), "western");
  EXPECT_STREQ(notationSystemToString(NotationSystem::Sargam), "sargam");
}

TEST(BasicTypesTest, RoleToString) {
  EXPECT_STREQ(roleToString(Role::Start), "start");
  EXPECT_STREQ(roleToString(Role::Middle), "middle");
  EXPECT_STREQ(roleToString(Role::End), "end");
}

TEST(BasicTypesTest, OrnamentTypeToString) {
  EXPECT_STREQ(ornamentTypeToString(OrnamentType::Mordent), "mordent");
  EXPECT_STREQ(ornamentTypeToString(OrnamentType::Trill), "trill");
  EXPECT_STREQ(ornamentTypeToString(OrnamentType::Turn), "turn");
  EXPECT_STREQ(ornamentTypeToString(OrnamentType::Grace), "grace");
}

// ---------------------------------------------------------------------------
// Barlines
// ---------------------------------------------------------------------------

TEST(BarlineStyleTest, ParsesEveryStyle) {
  BarlineStyle style = BarlineStyle::Single;
  ASSERT_TRUE(barlineStyleFromString("||", style));
  EXPECT_EQ(style, BarlineStyle::Double);
  ASSERT_TRUE(barlineStyleFromString("|.", style));
  EXPECT_EQ(style, BarlineStyle::Final);
  ASSERT_TRUE(barlineStyleFromString("|]", style));
  EXPECT_EQ(style, BarlineStyle::Final);
  ASSERT_TRUE(barlineStyleFromString("|:", style));
  EXPECT_EQ(style, BarlineStyle::RepeatStart);
  ASSERT_TRUE(barlineStyleFromString(":|", style));
  EXPECT_EQ(style, BarlineStyle::RepeatEnd);
  ASSERT_TRUE(barlineStyleFromString(":|:", style));
  EXPECT_EQ(style, BarlineStyle::RepeatBoth);
  ASSERT_TRUE(barlineStyleFromString("|", style));
  EXPECT_EQ(style, BarlineStyle::Single);
}

TEST(BarlineStyleTest, RejectsMalformed) {
  BarlineStyle style = BarlineStyle::Single;
  EXPECT_FALSE(barlineStyleFromString(":", style));
  EXPECT_FALSE(barlineStyleFromString("|||", style));
  EXPECT_FALSE(barlineStyleFromString("", style));
  EXPECT_EQ(style, BarlineStyle::Single);
}

TEST(BarlineStyleTest, ToStringIsCanonicalGlyph) {
  for (auto style : {BarlineStyle::Single, BarlineStyle::Double, BarlineStyle::Final,
                     BarlineStyle::RepeatStart, BarlineStyle::RepeatEnd,
                     BarlineStyle::RepeatBoth}) {
    BarlineStyle parsed = BarlineStyle::Single;
    ASSERT_TRUE(barlineStyleFromString(barlineStyleToString(style), parsed));
    EXPECT_EQ(parsed, style);
  }
}

}  // namespace
}  // namespace mtext
