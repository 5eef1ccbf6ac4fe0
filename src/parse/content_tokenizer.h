// Longest-match tokenizer for content lines.

#ifndef MTEXT_PARSE_CONTENT_TOKENIZER_H
#define MTEXT_PARSE_CONTENT_TOKENIZER_H

#include <vector>

#include "core/basic_types.h"
#include "parse/document_types.h"
#include "parse/element_types.h"
#include "parse/line_classifier.h"

namespace mtext {

/// @brief Tokenize one content line.
///
/// Emits Barline, Whitespace (one per run), Dash, Symbol("'"), Note (octave 0)
/// and Unknown (one glyph) elements with exact positions. Unknown glyphs are
/// not errors.
/// @param line Source line.
/// @param system Vocabulary for pitch matching.
/// @param elements Receives the element stream.
/// @param error Filled on a malformed barline such as ":" or "|||".
/// @return False on a structural error.
bool tokenizeContentLine(const SourceLine& line, NotationSystem system,
                         std::vector<ParsedElement>& elements, ParseError& error);

}  // namespace mtext

#endif  // MTEXT_PARSE_CONTENT_TOKENIZER_H
