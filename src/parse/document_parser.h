// Document assembly: directives, stave recognition and the per-stave pipeline.

#ifndef MTEXT_PARSE_DOCUMENT_PARSER_H
#define MTEXT_PARSE_DOCUMENT_PARSER_H

#include <string>
#include <string_view>
#include <vector>

#include "harmony/key.h"
#include "parse/document_types.h"
#include "parse/line_classifier.h"
#include "rhythm/rhythm_fsm.h"

namespace mtext {

/// @brief Validate a directive paragraph and store its entries.
///
/// Keys must be known (title, author, composer, key, tala, tempo); tala must
/// be 0-6 and key must name a tonic. Repeated keys overwrite in place.
/// @return False with error set on the first invalid line.
bool parseDirectiveBlock(const LineBlock& block, Document& document, ParseError& error);

/// @brief Classify and tokenize the lines of one stave paragraph.
/// @param block Non-blank paragraph.
/// @param force_content Treat the first line as the content line (single-line input).
/// @param stave Receives lines, notation system and multi-stave flags.
/// @param error Filled when the paragraph has zero or several content lines,
///        or when the content line has a malformed barline.
/// @return False on a structural error.
bool buildStave(const LineBlock& block, bool force_content, Stave& stave, ParseError& error);

/// @brief Key signature named by the document's key directive.
/// @return False (and C major in key_sig) when the directive is absent or invalid.
bool documentKeySignature(const Document& document, KeySignature& key_sig);

/// @brief Declared key, or C major without a valid key directive.
KeySignature effectiveKeySignature(const Document& document);

/// @brief Rhythm inputs derived from the key and tala directives.
RhythmContext rhythmContextFor(const Document& document);

/// @brief Run every stage over the input text.
///
/// On failure the document keeps every stave completed before the error.
/// @param input UTF-8 source text.
/// @param document Receives directives, blank-line runs and staves.
/// @param warnings Receives non-fatal diagnostics.
/// @param error Filled on a structural or invariant error.
/// @return False on error.
bool parseDocument(std::string_view input, Document& document,
                   std::vector<std::string>& warnings, ParseError& error);

}  // namespace mtext

#endif  // MTEXT_PARSE_DOCUMENT_PARSER_H
