// Tests for notation/pitch_vocabulary.h -- symbol tables and longest match.

#include "notation/pitch_vocabulary.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/text_utils.h"

namespace mtext {
namespace {

size_t matchAt(const std::string& line, size_t pos, NotationSystem system, Degree& degree) {
  return matchPitch(splitGlyphs(line), pos, system, degree);
}

// ---------------------------------------------------------------------------
// Table shape
// ---------------------------------------------------------------------------

TEST(PitchVocabularyTest, TableSizes) {
  // Seven bases times (natural + eight suffixes).
  EXPECT_EQ(vocabularyFor(NotationSystem::Number).size(), 63u);
  EXPECT_EQ(vocabularyFor(NotationSystem::Western).size(), 63u);
  EXPECT_EQ(vocabularyFor(NotationSystem::Sargam).size(), 70u);
}

TEST(PitchVocabularyTest, SortedLongestFirst) {
  for (NotationSystem system :
       {NotationSystem::Number, NotationSystem::Western, NotationSystem::Sargam}) {
    const auto& entries = vocabularyFor(system);
    for (size_t idx = 1; idx < entries.size(); ++idx) {
      EXPECT_GE(entries[idx - 1].glyphs.size(), entries[idx].glyphs.size());
    }
  }
}

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

TEST(MatchPitchTest, NumberLongestMatch) {
  Degree degree = Degree::N1;
  EXPECT_EQ(matchAt("1bb", 0, NotationSystem::Number, degree), 3u);
  EXPECT_EQ(degree, Degree::N1bb);
  EXPECT_EQ(matchAt("4#-", 0, NotationSystem::Number, degree), 2u);
  EXPECT_EQ(degree, Degree::N4s);
  EXPECT_EQ(matchAt("7", 0, NotationSystem::Number, degree), 1u);
  EXPECT_EQ(degree, Degree::N7);
}

TEST(MatchPitchTest, NumberRejectsOutOfRange) {
  Degree degree = Degree::N1;
  EXPECT_EQ(matchAt("8", 0, NotationSystem::Number, degree), 0u);
  EXPECT_EQ(matchAt("0", 0, NotationSystem::Number, degree), 0u);
  EXPECT_EQ(matchAt("C", 0, NotationSystem::Number, degree), 0u);
}

TEST(MatchPitchTest, WesternUnicodeAccidentals) {
  Degree degree = Degree::N1;
  EXPECT_EQ(matchAt("C\xE2\x99\xAF", 0, NotationSystem::Western, degree), 2u);
  EXPECT_EQ(degree, Degree::N1s);
  EXPECT_EQ(matchAt("B\xE2\x99\xAD\xE2\x99\xAD", 0, NotationSystem::Western, degree), 3u);
  EXPECT_EQ(degree, Degree::N7bb);
  EXPECT_EQ(matchAt("Eb", 0, NotationSystem::Western, degree), 2u);
  EXPECT_EQ(degree, Degree::N3b);
}

TEST(MatchPitchTest, MatchesAtOffset) {
  Degree degree = Degree::N1;
  EXPECT_EQ(matchAt("|1 2#", 3, NotationSystem::Number, degree), 2u);
  EXPECT_EQ(degree, Degree::N2s);
}

TEST(MatchPitchTest, SargamKomalAndTivra) {
  Degree degree = Degree::N1;
  EXPECT_EQ(matchAt("r", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N2b);
  EXPECT_EQ(matchAt("g", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N3b);
  EXPECT_EQ(matchAt("m", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N4);
  EXPECT_EQ(matchAt("M", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N4s);
  EXPECT_EQ(matchAt("P", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N5);
  EXPECT_EQ(matchAt("N", 0, NotationSystem::Sargam, degree), 1u);
  EXPECT_EQ(degree, Degree::N7);
}

TEST(MatchPitchTest, AnyPitchTakesLongest) {
  std::vector<std::string> glyphs = splitGlyphs("Dbb");
  EXPECT_EQ(matchAnyPitch(glyphs, 0), 3u);
  EXPECT_EQ(matchAnyPitch(splitGlyphs("x"), 0), 0u);
}

// ---------------------------------------------------------------------------
// Exact lookup
// ---------------------------------------------------------------------------

TEST(LookupPitchTest, ExactSymbols) {
  Degree degree = Degree::N1;
  EXPECT_TRUE(lookupPitch("6b", NotationSystem::Number, degree));
  EXPECT_EQ(degree, Degree::N6b);
  EXPECT_TRUE(lookupPitch("F#", NotationSystem::Western, degree));
  EXPECT_EQ(degree, Degree::N4s);
  EXPECT_FALSE(lookupPitch("F#", NotationSystem::Number, degree));
  EXPECT_FALSE(lookupPitch("1#b", NotationSystem::Number, degree));
}

TEST(LookupPitchTest, EveryDegreeHasANumberSymbol) {
  for (int step = 0; step < 7; ++step) {
    for (int alt = -2; alt <= 2; ++alt) {
      Degree expected = makeDegree(step, alt);
      Degree degree = Degree::N1;
      ASSERT_TRUE(lookupPitch(degreeToString(expected), NotationSystem::Number, degree));
      EXPECT_EQ(degree, expected);
    }
  }
}

}  // namespace
}  // namespace mtext
