// Tests for parse/annotation_tokenizer.h -- upper, lower and lyrics lines.

#include "parse/annotation_tokenizer.h"

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

/// @brief Drop Space elements to simplify assertions.
std::vector<AnnotationElement> withoutSpaces(const std::vector<AnnotationElement>& elements) {
  std::vector<AnnotationElement> result;
  for (const auto& element : elements) {
    if (element.kind != AnnotationKind::Space) result.push_back(element);
  }
  return result;
}

// ---------------------------------------------------------------------------
// Octave marker values
// ---------------------------------------------------------------------------

TEST(OctaveMarkerValueTest, UpperAndLower) {
  EXPECT_EQ(octaveMarkerValue(".", true), 1);
  EXPECT_EQ(octaveMarkerValue("\xE2\x80\xA2", true), 1);
  EXPECT_EQ(octaveMarkerValue(":", true), 2);
  EXPECT_EQ(octaveMarkerValue("*", true), 3);
  EXPECT_EQ(octaveMarkerValue("'", true), 4);
  EXPECT_EQ(octaveMarkerValue(":", false), -2);
  EXPECT_EQ(octaveMarkerValue("'", false), -4);
  EXPECT_EQ(octaveMarkerValue("x", true), 0);
}

// ---------------------------------------------------------------------------
// Upper lines
// ---------------------------------------------------------------------------

TEST(UpperLineTest, MarkersAndSpaces) {
  std::vector<AnnotationElement> elements = tokenizeUpperLine(makeLine(".      :"));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0].kind, AnnotationKind::OctaveMarker);
  EXPECT_EQ(elements[0].octave_value, 1);
  EXPECT_EQ(elements[0].state, MarkerState::Pending);
  EXPECT_EQ(elements[1].kind, AnnotationKind::Space);
  EXPECT_EQ(elements[1].state, MarkerState::Inert);
  EXPECT_EQ(elements[2].octave_value, 2);
  EXPECT_EQ(elements[2].position.col, 7u);
}

TEST(UpperLineTest, SlurIndicator) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeUpperLine(makeLine("  ___")));
  ASSERT_EQ(elements.size(), 1u);
  EXPECT_EQ(elements[0].kind, AnnotationKind::SlurIndicator);
  EXPECT_EQ(elements[0].position.col, 2u);
  EXPECT_EQ(elements[0].end_col, 4u);
  EXPECT_EQ(elements[0].text_length, 3u);
  EXPECT_EQ(elements[0].value, std::string("___"));
}

TEST(UpperLineTest, SingleUnderscoreIsUnknown) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeUpperLine(makeLine(" _ ")));
  ASSERT_EQ(elements.size(), 1u);
  EXPECT_EQ(elements[0].kind, AnnotationKind::Unknown);
  EXPECT_EQ(elements[0].state, MarkerState::Inert);
}

TEST(UpperLineTest, Ornaments) {
  std::vector<AnnotationElement> elements =
      withoutSpaces(tokenizeUpperLine(makeLine("~ ~~ tr \xE2\x88\x9E [12] 34")));
  ASSERT_EQ(elements.size(), 6u);
  for (const auto& element : elements) EXPECT_EQ(element.kind, AnnotationKind::Ornament);
  EXPECT_EQ(elements[0].ornament, OrnamentType::Mordent);
  EXPECT_EQ(elements[1].ornament, OrnamentType::Trill);
  EXPECT_EQ(elements[2].ornament, OrnamentType::Trill);
  EXPECT_EQ(elements[3].ornament, OrnamentType::Turn);
  EXPECT_EQ(elements[4].ornament, OrnamentType::Grace);
  EXPECT_EQ(elements[4].value, std::string("[12]"));
  EXPECT_EQ(elements[4].end_col, 13u);
  EXPECT_EQ(elements[5].ornament, OrnamentType::Grace);
  EXPECT_EQ(elements[5].value, std::string("34"));
}

TEST(UpperLineTest, UnknownGlyphsMerge) {
  std::vector<AnnotationElement> elements = tokenizeUpperLine(makeLine("xyz ."));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0].kind, AnnotationKind::Unknown);
  EXPECT_EQ(elements[0].value, std::string("xyz"));
  EXPECT_EQ(elements[0].text_length, 3u);
  EXPECT_EQ(elements[0].end_col, 2u);
}

TEST(UpperLineTest, UnclosedBracketIsUnknown) {
  std::vector<AnnotationElement> elements = tokenizeUpperLine(makeLine("[1"));
  ASSERT_EQ(elements.size(), 2u);
  EXPECT_EQ(elements[0].kind, AnnotationKind::Unknown);
  EXPECT_EQ(elements[1].kind, AnnotationKind::Ornament);
}

TEST(UpperLineTest, PositionsUseOffset) {
  std::vector<AnnotationElement> elements =
      tokenizeUpperLine(makeLine("\xE2\x80\xA2 .", 4, 100));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[2].position.row, 4u);
  EXPECT_EQ(elements[2].position.col, 2u);
  EXPECT_EQ(elements[2].position.char_index, 102u);
}

// ---------------------------------------------------------------------------
// Lower lines
// ---------------------------------------------------------------------------

TEST(LowerLineTest, NegativeMarkersAndBeatGroup) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeLowerLine(makeLine(". ___ :")));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0].octave_value, -1);
  EXPECT_EQ(elements[1].kind, AnnotationKind::BeatGroupIndicator);
  EXPECT_EQ(elements[2].octave_value, -2);
}

TEST(LowerLineTest, HyphenatedSyllables) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeLowerLine(makeLine(". hel-lo")));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[1].kind, AnnotationKind::Syllable);
  EXPECT_EQ(elements[1].value, std::string("hel-"));
  EXPECT_EQ(elements[1].position.col, 2u);
  EXPECT_EQ(elements[2].value, std::string("lo"));
  EXPECT_EQ(elements[2].position.col, 6u);
}

TEST(LowerLineTest, ApostropheInsideWordStaysInSyllable) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeLowerLine(makeLine("don't '")));
  ASSERT_EQ(elements.size(), 2u);
  EXPECT_EQ(elements[0].value, std::string("don't"));
  EXPECT_EQ(elements[1].kind, AnnotationKind::OctaveMarker);
  EXPECT_EQ(elements[1].octave_value, -4);
}

// ---------------------------------------------------------------------------
// Lyrics lines
// ---------------------------------------------------------------------------

TEST(LyricsLineTest, WordsBecomeSyllables) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeLyricsLine(makeLine("ta re ga")));
  ASSERT_EQ(elements.size(), 3u);
  EXPECT_EQ(elements[0].value, std::string("ta"));
  EXPECT_EQ(elements[1].position.col, 3u);
  EXPECT_EQ(elements[2].value, std::string("ga"));
  for (const auto& element : elements) EXPECT_EQ(element.kind, AnnotationKind::Syllable);
}

TEST(LyricsLineTest, HyphenOnlyPartsAreSkipped) {
  std::vector<AnnotationElement> elements = withoutSpaces(tokenizeLyricsLine(makeLine("a-- b!")));
  ASSERT_EQ(elements.size(), 2u);
  EXPECT_EQ(elements[0].value, std::string("a-"));
  EXPECT_EQ(elements[1].value, std::string("b!"));
}

}  // namespace
}  // namespace mtext
