// Tests for parse/content_tokenizer.h -- content line element streams.

#include "parse/content_tokenizer.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace mtext {
namespace {

SourceLine makeLine(const std::string& text, uint32_t row = 0, uint32_t offset = 0) {
  SourceLine line;
  line.text = text;
  line.row = row;
  line.char_offset = offset;
  return line;
}

std::vector<ParsedElement> tokenize(const std::string& text,
                                    NotationSystem system = NotationSystem::Number) {
  std::vector<ParsedElement> elements;
  ParseError error;
  EXPECT_TRUE(tokenizeContentLine(makeLine(text), system, elements, error)) << error.message;
  return elements;
}

// ---------------------------------------------------------------------------
// Basic streams
// ---------------------------------------------------------------------------

TEST(ContentTokenizerTest, NotesBarlineAndWhitespace) {
  std::vector<ParsedElement> elements = tokenize("|1 2 3");
  ASSERT_EQ(elements.size(), 6u);
  EXPECT_EQ(elements[0].kind, ElementKind::Barline);
  EXPECT_EQ(elements[1].kind, ElementKind::Note);
  EXPECT_EQ(elements[1].value, "1");
  EXPECT_EQ(elements[1].degree, Degree::N1);
  EXPECT_EQ(elements[1].octave, 0);
  EXPECT_EQ(elements[2].kind, ElementKind::Whitespace);
  EXPECT_EQ(elements[5].degree, Degree::N3);
  EXPECT_EQ(elements[5].position.col, 5u);
}

TEST(ContentTokenizerTest, WhitespaceRunIsOneElement) {
  std::vector<ParsedElement> elements = tokenize("1   2");
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[1].kind, ElementKind::Whitespace);
  EXPECT_EQ(elements[1].value, "   ");
  EXPECT_EQ(elements[2].position.col, 4u);
}

TEST(ContentTokenizerTest, DashesAndBreathMark) {
  std::vector<ParsedElement> elements = tokenize("1-2'-");
  ASSERT_EQ(elements.size(), 5u);
  EXPECT_EQ(elements[1].kind, ElementKind::Dash);
  EXPECT_EQ(elements[3].kind, ElementKind::Symbol);
  EXPECT_EQ(elements[3].value, "'");
  EXPECT_EQ(elements[4].kind, ElementKind::Dash);
}

TEST(ContentTokenizerTest, AccidentalsLongestMatch) {
  std::vector<ParsedElement> elements = tokenize("|4# 7bb");
  ASSERT_EQ(elements.size(), 4u);
  EXPECT_EQ(elements[1].value, "4#");
  EXPECT_EQ(elements[1].degree, Degree::N4s);
  EXPECT_EQ(elements[3].value, "7bb");
  EXPECT_EQ(elements[3].degree, Degree::N7bb);
}

TEST(ContentTokenizerTest, UnknownGlyphsPassThrough) {
  std::vector<ParsedElement> elements = tokenize("1x9");
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[1].kind, ElementKind::Unknown);
  EXPECT_EQ(elements[1].value, "x");
  EXPECT_EQ(elements[2].kind, ElementKind::Unknown);
  EXPECT_EQ(elements[2].value, "9");
}

TEST(ContentTokenizerTest, VocabularyFollowsSystem) {
  std::vector<ParsedElement> western = tokenize("|C D\xE2\x99\xAF", NotationSystem::Western);
  ASSERT_EQ(western.size(), 4u);
  EXPECT_EQ(western[3].degree, Degree::N2s);
  EXPECT_EQ(western[3].value, "D\xE2\x99\xAF");

  std::vector<ParsedElement> sargam = tokenize("S r M", NotationSystem::Sargam);
  ASSERT_EQ(sargam.size(), 5u);
  EXPECT_EQ(sargam[2].degree, Degree::N2b);
  EXPECT_EQ(sargam[4].degree, Degree::N4s);

  // A Western letter is Unknown in a Number stave.
  std::vector<ParsedElement> number = tokenize("1 C");
  EXPECT_EQ(number[2].kind, ElementKind::Unknown);
}

// ---------------------------------------------------------------------------
// Positions
// ---------------------------------------------------------------------------

TEST(ContentTokenizerTest, PositionsUseRowAndOffset) {
  std::vector<ParsedElement> elements;
  ParseError error;
  ASSERT_TRUE(tokenizeContentLine(makeLine("|1 \xE2\x80\xA2 2", 3, 40), NotationSystem::Number,
                                  elements, error));
  const ParsedElement& last = elements.back();
  EXPECT_EQ(last.value, "2");
  EXPECT_EQ(last.position.row, 3u);
  EXPECT_EQ(last.position.col, 5u);
  EXPECT_EQ(last.position.char_index, 45u);
}

// ---------------------------------------------------------------------------
// Barlines
// ---------------------------------------------------------------------------

TEST(ContentTokenizerTest, BarlineStyles) {
  std::vector<ParsedElement> elements = tokenize("|: 1 :| 2 || 3 |.");
  std::vector<BarlineStyle> styles;
  for (const auto& element : elements) {
    if (element.kind == ElementKind::Barline) styles.push_back(element.barline_style);
  }
  std::vector<BarlineStyle> expected = {BarlineStyle::RepeatStart, BarlineStyle::RepeatEnd,
                                        BarlineStyle::Double, BarlineStyle::Final};
  EXPECT_EQ(styles, expected);
}

TEST(ContentTokenizerTest, RepeatBoth) {
  std::vector<ParsedElement> elements = tokenize("1 :|: 2");
  ASSERT_EQ(elements.size(), 5u);
  EXPECT_EQ(elements[2].value, ":|:");
  EXPECT_EQ(elements[2].barline_style, BarlineStyle::RepeatBoth);
}

TEST(ContentTokenizerTest, MalformedBarlineIsError) {
  std::vector<ParsedElement> elements;
  ParseError error;
  EXPECT_FALSE(tokenizeContentLine(makeLine("1 2 |||", 2), NotationSystem::Number, elements,
                                   error));
  EXPECT_EQ(error.line, 3u);
  EXPECT_EQ(error.column, 5u);
  EXPECT_EQ(error.message, "Malformed barline '|||'");

  elements.clear();
  EXPECT_FALSE(tokenizeContentLine(makeLine("1 : 2"), NotationSystem::Number, elements, error));
  EXPECT_EQ(error.message, "Malformed barline ':'");
}

}  // namespace
}  // namespace mtext
