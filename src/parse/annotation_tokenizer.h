// Tokenizers for upper, lower and lyrics lines.

#ifndef MTEXT_PARSE_ANNOTATION_TOKENIZER_H
#define MTEXT_PARSE_ANNOTATION_TOKENIZER_H

#include <string>
#include <vector>

#include "parse/element_types.h"
#include "parse/line_classifier.h"

namespace mtext {

/// @brief Octave shift of a marker glyph: "." 1, ":" 2, "*" 3, "'" 4.
/// @param glyph Marker glyph ("•" counts as ".").
/// @param upper True above the content line (positive), false below (negative).
/// @return Signed shift, 0 if the glyph is not a marker.
int8_t octaveMarkerValue(const std::string& glyph, bool upper);

/// @brief Tokenize a line above the content line.
///
/// Produces OctaveMarker, SlurIndicator ("__" runs), Ornament ("~", "~~", "tr",
/// "∞", "[..]", digit clusters), Space and Unknown elements. A single "_" is
/// Unknown.
std::vector<AnnotationElement> tokenizeUpperLine(const SourceLine& line);

/// @brief Tokenize a line below the content line.
///
/// Produces OctaveMarker (negative), BeatGroupIndicator ("__" runs), Syllable,
/// Space and Unknown elements.
std::vector<AnnotationElement> tokenizeLowerLine(const SourceLine& line);

/// @brief Tokenize a lyrics line into Syllable and Space elements.
///
/// Hyphenated words split into one syllable per part; every part except the
/// last keeps its trailing hyphen ("he-llo" -> "he-", "llo").
std::vector<AnnotationElement> tokenizeLyricsLine(const SourceLine& line);

}  // namespace mtext

#endif  // MTEXT_PARSE_ANNOTATION_TOKENIZER_H
