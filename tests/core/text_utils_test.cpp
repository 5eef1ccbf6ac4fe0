// Tests for core/text_utils.h -- glyph splitting and whitespace helpers.

#include "core/text_utils.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace mtext {
namespace {

TEST(TextUtilsTest, SplitAsciiGlyphs) {
  std::vector<std::string> glyphs = splitGlyphs("|1 2");
  ASSERT_EQ(glyphs.size(), 4u);
  EXPECT_EQ(glyphs[0], "|");
  EXPECT_EQ(glyphs[2], " ");
  EXPECT_EQ(glyphs[3], "2");
}

TEST(TextUtilsTest, SplitMultiByteGlyphs) {
  // "C♯•" = C, U+266F (3 bytes), U+2022 (3 bytes).
  std::vector<std::string> glyphs = splitGlyphs("C\xE2\x99\xAF\xE2\x80\xA2");
  ASSERT_EQ(glyphs.size(), 3u);
  EXPECT_EQ(glyphs[1], "\xE2\x99\xAF");
  EXPECT_EQ(glyphs[2], "\xE2\x80\xA2");
}

TEST(TextUtilsTest, TruncatedSequenceKeptAsBytes) {
  std::vector<std::string> glyphs = splitGlyphs("a\xE2\x99");
  ASSERT_EQ(glyphs.size(), 3u);
  EXPECT_EQ(glyphs[1], "\xE2");
}

TEST(TextUtilsTest, GlyphCountMatchesSplit) {
  EXPECT_EQ(glyphCount(""), 0u);
  EXPECT_EQ(glyphCount("abc"), 3u);
  EXPECT_EQ(glyphCount("B\xE2\x99\xAD 4"), 4u);
}

TEST(TextUtilsTest, GlyphPredicates) {
  EXPECT_TRUE(isSpaceGlyph(" "));
  EXPECT_TRUE(isSpaceGlyph("\t"));
  EXPECT_FALSE(isSpaceGlyph("_"));
  EXPECT_TRUE(glyphIs("-", '-'));
  EXPECT_FALSE(glyphIs("--", '-'));
  EXPECT_TRUE(isAsciiLetter("m"));
  EXPECT_FALSE(isAsciiLetter("3"));
  EXPECT_FALSE(isAsciiLetter("\xE2\x99\xAF"));
}

TEST(TextUtilsTest, Blank) {
  EXPECT_TRUE(isBlank(""));
  EXPECT_TRUE(isBlank(" \t\r"));
  EXPECT_FALSE(isBlank("  .  "));
}

TEST(TextUtilsTest, TrimAndSplit) {
  EXPECT_EQ(trim("  title: x \r"), "title: x");
  std::vector<std::string> words = splitWhitespace("  ta  re\tga ");
  ASSERT_EQ(words.size(), 3u);
  EXPECT_EQ(words[0], "ta");
  EXPECT_EQ(words[2], "ga");
}

TEST(TextUtilsTest, ToLower) {
  EXPECT_EQ(toLower("Title"), "title");
  EXPECT_EQ(toLower("KEY"), "key");
}

}  // namespace
}  // namespace mtext
