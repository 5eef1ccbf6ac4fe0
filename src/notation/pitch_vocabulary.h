// Pitch symbol vocabularies for the Number, Western and Sargam systems.

#ifndef MTEXT_NOTATION_PITCH_VOCABULARY_H
#define MTEXT_NOTATION_PITCH_VOCABULARY_H

#include <cstddef>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/degree.h"

namespace mtext {

/// @brief One pitch symbol and the degree it denotes.
struct VocabularyEntry {
  std::string symbol;               ///< UTF-8 spelling, e.g. "1#", "C♭", "r".
  std::vector<std::string> glyphs;  ///< symbol split into code points.
  Degree degree = Degree::N1;
};

/// @brief Get the vocabulary of a notation system.
///
/// Entries are sorted by descending glyph count, so a linear scan yields the
/// longest match first ("1bb" before "1b", "♯♯" forms before "♯").
/// @param system Notation system.
/// @return Immutable entry list.
const std::vector<VocabularyEntry>& vocabularyFor(NotationSystem system);

/// @brief Longest-match a pitch symbol at a glyph position.
/// @param glyphs Line split into code points.
/// @param pos Glyph index to match at.
/// @param system Vocabulary to use.
/// @param degree Receives the matched degree.
/// @return Number of glyphs matched, 0 if nothing matches.
size_t matchPitch(const std::vector<std::string>& glyphs, size_t pos,
                  NotationSystem system, Degree& degree);

/// @brief Longest match across all three vocabularies.
/// @return Number of glyphs matched, 0 if no vocabulary matches.
size_t matchAnyPitch(const std::vector<std::string>& glyphs, size_t pos);

/// @brief Exact lookup of a complete symbol.
/// @return True if symbol belongs to the system's vocabulary.
bool lookupPitch(const std::string& symbol, NotationSystem system, Degree& degree);

}  // namespace mtext

#endif  // MTEXT_NOTATION_PITCH_VOCABULARY_H
