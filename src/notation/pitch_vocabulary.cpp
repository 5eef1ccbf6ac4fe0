/// @file
/// @brief Vocabulary tables and longest-match lookup.

#include "notation/pitch_vocabulary.h"

#include <algorithm>

#include "core/text_utils.h"

namespace mtext {

namespace {

/// Accidental suffix spellings with their alteration.
struct AccidentalSuffix {
  const char* text;
  int alteration;
};

constexpr AccidentalSuffix kSuffixes[] = {
    {"#", 1},  {"##", 2},  {"b", -1},  {"bb", -2},
    {"♯", 1}, {"♯♯", 2}, {"♭", -1}, {"♭♭", -2},
};

void addEntry(std::vector<VocabularyEntry>& entries, const std::string& symbol, Degree degree) {
  VocabularyEntry entry;
  entry.symbol = symbol;
  entry.glyphs = splitGlyphs(symbol);
  entry.degree = degree;
  entries.push_back(entry);
}

/// @brief Add a natural base symbol and all of its suffixed forms.
void addWithAccidentals(std::vector<VocabularyEntry>& entries, const std::string& base, int step) {
  addEntry(entries, base, makeDegree(step, 0));
  for (const auto& suffix : kSuffixes) {
    addEntry(entries, base + suffix.text, makeDegree(step, suffix.alteration));
  }
}

void sortLongestFirst(std::vector<VocabularyEntry>& entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const VocabularyEntry& lhs, const VocabularyEntry& rhs) {
                     return lhs.glyphs.size() > rhs.glyphs.size();
                   });
}

std::vector<VocabularyEntry> buildNumber() {
  std::vector<VocabularyEntry> entries;
  for (int step = 0; step < 7; ++step) {
    addWithAccidentals(entries, std::string(1, static_cast<char>('1' + step)), step);
  }
  sortLongestFirst(entries);
  return entries;
}

std::vector<VocabularyEntry> buildWestern() {
  static const char kLetters[] = {'C', 'D', 'E', 'F', 'G', 'A', 'B'};
  std::vector<VocabularyEntry> entries;
  for (int step = 0; step < 7; ++step) {
    addWithAccidentals(entries, std::string(1, kLetters[step]), step);
  }
  sortLongestFirst(entries);
  return entries;
}

std::vector<VocabularyEntry> buildSargam() {
  std::vector<VocabularyEntry> entries;
  // Shuddha (natural) uppercase forms accept every accidental suffix.
  addWithAccidentals(entries, "S", 0);
  addWithAccidentals(entries, "R", 1);
  addWithAccidentals(entries, "G", 2);
  addWithAccidentals(entries, "P", 4);
  addWithAccidentals(entries, "D", 5);
  addWithAccidentals(entries, "N", 6);

  // Lowercase komal forms and the lowercase sa/pa aliases.
  addEntry(entries, "s", Degree::N1);
  addEntry(entries, "r", Degree::N2b);
  addEntry(entries, "g", Degree::N3b);
  addEntry(entries, "p", Degree::N5);
  addEntry(entries, "d", Degree::N6b);
  addEntry(entries, "n", Degree::N7b);

  // Ma: lowercase is shuddha, uppercase is tivra.
  addEntry(entries, "m", Degree::N4);
  addEntry(entries, "mb", Degree::N4b);
  addEntry(entries, "mbb", Degree::N4bb);
  addEntry(entries, "m#", Degree::N4s);
  addEntry(entries, "m♭", Degree::N4b);
  addEntry(entries, "m♭♭", Degree::N4bb);
  addEntry(entries, "m♯", Degree::N4s);
  addEntry(entries, "M", Degree::N4s);
  addEntry(entries, "M#", Degree::N4ss);
  addEntry(entries, "M♯", Degree::N4ss);

  sortLongestFirst(entries);
  return entries;
}

bool matchesAt(const std::vector<std::string>& glyphs, size_t pos, const VocabularyEntry& entry) {
  if (pos + entry.glyphs.size() > glyphs.size()) return false;
  for (size_t idx = 0; idx < entry.glyphs.size(); ++idx) {
    if (glyphs[pos + idx] != entry.glyphs[idx]) return false;
  }
  return true;
}

}  // namespace

const std::vector<VocabularyEntry>& vocabularyFor(NotationSystem system) {
  static const std::vector<VocabularyEntry> kNumber = buildNumber();
  static const std::vector<VocabularyEntry> kWestern = buildWestern();
  static const std::vector<VocabularyEntry> kSargam = buildSargam();
  switch (system) {
    case NotationSystem::Number:  return kNumber;
    case NotationSystem::Western: return kWestern;
    case NotationSystem::Sargam:  return kSargam;
  }
  return kNumber;
}

size_t matchPitch(const std::vector<std::string>& glyphs, size_t pos,
                  NotationSystem system, Degree& degree) {
  for (const auto& entry : vocabularyFor(system)) {
    if (matchesAt(glyphs, pos, entry)) {
      degree = entry.degree;
      return entry.glyphs.size();
    }
  }
  return 0;
}

size_t matchAnyPitch(const std::vector<std::string>& glyphs, size_t pos) {
  size_t best = 0;
  Degree unused = Degree::N1;
  for (NotationSystem system :
       {NotationSystem::Number, NotationSystem::Western, NotationSystem::Sargam}) {
    best = std::max(best, matchPitch(glyphs, pos, system, unused));
  }
  return best;
}

bool lookupPitch(const std::string& symbol, NotationSystem system, Degree& degree) {
  for (const auto& entry : vocabularyFor(system)) {
    if (entry.symbol == symbol) {
      degree = entry.degree;
      return true;
    }
  }
  return false;
}

}  // namespace mtext
