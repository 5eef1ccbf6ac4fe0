// Tests for spatial/spatial_assigner.h -- marker consumption and slur placement.

#include "spatial/spatial_assigner.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "test_helpers.h"

namespace mtext {
namespace {

using test_helpers::firstStave;
using test_helpers::notes;
using test_helpers::parseOk;

/// @brief True when every marker annotation was consumed or dropped.
bool allMarkersResolved(const Stave& stave) {
  for (const auto& line : stave.lines) {
    for (const auto& annotation : line.annotations) {
      if (!annotation.isMarker()) continue;
      if (annotation.value.has_value()) return false;
      if (annotation.state != MarkerState::Consumed && annotation.state != MarkerState::Dropped) {
        return false;
      }
    }
  }
  return true;
}

bool containsWarning(const std::vector<std::string>& warnings, const std::string& needle) {
  for (const auto& warning : warnings) {
    if (warning.find(needle) != std::string::npos) return true;
  }
  return false;
}

// ---------------------------------------------------------------------------
// Octave markers
// ---------------------------------------------------------------------------

TEST(OctaveMarkerTest, ExactColumnMatch) {
  Document document = parseOk(" . :\n|1 2 3");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched.size(), 3u);
  EXPECT_EQ(pitched[0]->octave, 1);
  EXPECT_EQ(pitched[1]->octave, 2);
  EXPECT_EQ(pitched[2]->octave, 0);

  ASSERT_EQ(pitched[0]->children.size(), 1u);
  const ParsedChild& child = pitched[0]->children[0];
  EXPECT_EQ(child.kind, ChildKind::OctaveMarker);
  EXPECT_EQ(child.text, ".");
  EXPECT_EQ(child.octave_value, 1);
  EXPECT_EQ(child.distance, -1);
  EXPECT_TRUE(allMarkersResolved(*stave));
}

TEST(OctaveMarkerTest, UpperAndLowerAdd) {
  Document document = parseOk(" .\n|1 2 3\n :");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  EXPECT_EQ(pitched[0]->octave, -1);
  ASSERT_EQ(pitched[0]->children.size(), 2u);
  EXPECT_EQ(pitched[0]->children[1].distance, 1);
  EXPECT_EQ(pitched[0]->children[1].octave_value, -2);
}

TEST(OctaveMarkerTest, NearestNoteFallback) {
  Document document = parseOk(".      :\n|1 2 3");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  EXPECT_EQ(pitched[0]->octave, 1);
  EXPECT_EQ(pitched[1]->octave, 0);
  EXPECT_EQ(pitched[2]->octave, 2);
}

TEST(OctaveMarkerTest, InnerMarkerShadowsOuter) {
  std::vector<std::string> warnings;
  Document document = parseOk(" :\n .\n|1 2 3", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  EXPECT_EQ(notes(*stave)[0]->octave, 1);
  EXPECT_TRUE(containsWarning(warnings, "shadowed"));
  EXPECT_EQ(stave->lines[0].annotations[1].state, MarkerState::Dropped);
  EXPECT_TRUE(allMarkersResolved(*stave));
}

TEST(OctaveMarkerTest, FarMarkerIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk("           .\n|1 2 3", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  for (const ParsedElement* note : notes(*stave)) EXPECT_EQ(note->octave, 0);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0], "Octave marker '.' at line 1 column 12 has no target note");
}

// ---------------------------------------------------------------------------
// Ornaments and tala
// ---------------------------------------------------------------------------

TEST(OrnamentTest, AttachesToNoteBelow) {
  Document document = parseOk("   tr\n|1 2 3");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched[1]->children.size(), 1u);
  EXPECT_EQ(pitched[1]->children[0].kind, ChildKind::Ornament);
  EXPECT_EQ(pitched[1]->children[0].ornament, OrnamentType::Trill);
  EXPECT_EQ(pitched[1]->children[0].text, "tr");
}

TEST(OrnamentTest, DigitAboveBarlineIsTala) {
  Document document = parseOk("0   3\n|1 2 |3");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  const StaveLine* content = stave->contentLine();
  ASSERT_NE(content, nullptr);
  ASSERT_EQ(content->elements[0].kind, ElementKind::Barline);
  ASSERT_TRUE(content->elements[0].tala.has_value());
  EXPECT_EQ(*content->elements[0].tala, 0);
  // The "3" sits over a note, not a barline, so it is a grace ornament.
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched[1]->children.size(), 1u);
  EXPECT_EQ(pitched[1]->children[0].ornament, OrnamentType::Grace);
}

// ---------------------------------------------------------------------------
// Slurs
// ---------------------------------------------------------------------------

TEST(SlurTest, RolesAndSyntheticElements) {
  Document document = parseOk(" _____\n|1 2 3");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched.size(), 3u);
  EXPECT_EQ(pitched[0]->slur, Role::Start);
  EXPECT_EQ(pitched[1]->slur, Role::Middle);
  EXPECT_EQ(pitched[2]->slur, Role::End);
  for (const ParsedElement* note : pitched) EXPECT_TRUE(note->in_slur);

  const std::vector<ParsedElement>& elements = stave->contentLine()->elements;
  ASSERT_EQ(elements.size(), 8u);
  EXPECT_EQ(elements[1].kind, ElementKind::SlurStart);
  EXPECT_EQ(elements[1].value, "_____");
  EXPECT_EQ(elements[1].position.col, 1u);
  EXPECT_EQ(elements[7].kind, ElementKind::SlurEnd);
  EXPECT_EQ(elements[7].position.col, 5u);
  EXPECT_TRUE(allMarkersResolved(*stave));
}

TEST(SlurTest, SingleNoteSlurIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk("  ___\n|1 2 3", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  for (const ParsedElement* note : notes(*stave)) EXPECT_FALSE(note->in_slur);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0],
            "Slur at columns 3-5 only covers one note and will be ignored (slurs require 2+ notes)");
  EXPECT_EQ(stave->contentLine()->elements.size(), 6u);
}

TEST(SlurTest, SlurOverWhitespaceIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk("  __\n|1   2", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  for (const ParsedElement* note : notes(*stave)) EXPECT_FALSE(note->in_slur);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0], "Slur at columns 3-4 doesn't align with any notes");
  EXPECT_TRUE(allMarkersResolved(*stave));
}

TEST(SlurTest, OverlappingSlurIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk(" ___\n   ___\n|1 2 3", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  EXPECT_EQ(pitched[0]->slur, Role::Start);
  EXPECT_EQ(pitched[1]->slur, Role::End);
  EXPECT_FALSE(pitched[2]->in_slur);
  EXPECT_TRUE(containsWarning(warnings, "overlaps an earlier slur"));
}

// ---------------------------------------------------------------------------
// Beat groups
// ---------------------------------------------------------------------------

TEST(BeatGroupTest, CoveredNotes) {
  Document document = parseOk("|123\n ___");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched.size(), 3u);
  EXPECT_EQ(pitched[0]->beat_group, Role::Start);
  EXPECT_EQ(pitched[1]->beat_group, Role::Middle);
  EXPECT_EQ(pitched[2]->beat_group, Role::End);
  ASSERT_EQ(pitched[0]->children.size(), 1u);
  EXPECT_EQ(pitched[0]->children[0].kind, ChildKind::BeatGroupIndicator);
  EXPECT_EQ(pitched[0]->children[0].span, 3u);
  EXPECT_FALSE(pitched[0]->in_slur);
}

TEST(BeatGroupTest, NearestPairFallback) {
  std::vector<std::string> warnings;
  Document document = parseOk("|1 2\n  __", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  EXPECT_EQ(pitched[0]->beat_group, Role::Start);
  EXPECT_EQ(pitched[1]->beat_group, Role::End);
  EXPECT_TRUE(warnings.empty());
}

TEST(BeatGroupTest, OverlappingGroupIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk("|1 2 3\n ___\n   ___", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched.size(), 3u);
  EXPECT_EQ(pitched[0]->beat_group, Role::Start);
  EXPECT_EQ(pitched[1]->beat_group, Role::End);
  EXPECT_FALSE(pitched[2]->in_beat_group);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0],
            "Beat group at columns 4-6 overlaps an earlier beat group and will be ignored");
  EXPECT_TRUE(allMarkersResolved(*stave));
}

// ---------------------------------------------------------------------------
// Syllables
// ---------------------------------------------------------------------------

TEST(SyllableTest, ZippedOntoNotes) {
  Document document = parseOk("|1 2 3\nta re ga");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  const char* expected[] = {"ta", "re", "ga"};
  for (size_t idx = 0; idx < pitched.size(); ++idx) {
    ASSERT_EQ(pitched[idx]->children.size(), 1u);
    EXPECT_EQ(pitched[idx]->children[0].kind, ChildKind::Syllable);
    EXPECT_EQ(pitched[idx]->children[0].text, expected[idx]);
    EXPECT_EQ(pitched[idx]->children[0].distance, 1);
  }
}

TEST(SyllableTest, SlurredNotesGetContinuation) {
  Document document = parseOk(" ___\n|1 2 3\nta re");
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  auto pitched = notes(*stave);
  ASSERT_EQ(pitched.size(), 3u);
  EXPECT_EQ(pitched[0]->children[0].text, "ta");
  EXPECT_EQ(pitched[1]->children[0].text, "_");
  EXPECT_EQ(pitched[2]->children[0].text, "re");
}

TEST(SyllableTest, LeftoverSyllableIsDropped) {
  std::vector<std::string> warnings;
  Document document = parseOk("|1 2\nta re ga", &warnings);
  const Stave* stave = firstStave(document);
  ASSERT_NE(stave, nullptr);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_EQ(warnings[0], "Syllable 'ga' at line 2 column 7 has no note to attach to");
  EXPECT_TRUE(allMarkersResolved(*stave));
}

}  // namespace
}  // namespace mtext
