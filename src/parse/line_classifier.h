// Line splitting, paragraph segmentation and per-line classification.

#ifndef MTEXT_PARSE_LINE_CLASSIFIER_H
#define MTEXT_PARSE_LINE_CLASSIFIER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "parse/document_types.h"

namespace mtext {

/// Minimum share of musical glyphs for a single-line document to parse.
constexpr double kSingleLineMusicalThreshold = 0.25;

/// @brief One physical input line.
struct SourceLine {
  std::string text;          ///< Without the line terminator.
  uint32_t row = 0;          ///< 0-based line number.
  uint32_t char_offset = 0;  ///< Absolute code point offset of column 0.
};

/// @brief A paragraph (consecutive non-blank lines) or a run of blank lines.
struct LineBlock {
  bool blank = false;
  std::vector<SourceLine> lines;
};

/// @brief Split input on '\n', stripping a trailing '\r' from each line.
std::vector<SourceLine> splitSourceLines(std::string_view input);

/// @brief Group lines into paragraphs separated by runs of blank lines.
std::vector<LineBlock> splitBlocks(const std::vector<SourceLine>& lines);

// ---------------------------------------------------------------------------
// Musical element heuristics
// ---------------------------------------------------------------------------

/// @brief True if a digit match at [start, start+len) touches 0, 8 or 9.
bool isPartOfNumber(const std::vector<std::string>& glyphs, size_t start, size_t len);

/// @brief True if a letter match at [start, start+len) touches a lowercase
///        letter that is not a Sargam pitch letter (s r g m p d n).
bool isPartOfEnglishWord(const std::vector<std::string>& glyphs, size_t start, size_t len);

/// @brief Count dashes plus pitch tokens of any vocabulary.
uint32_t countMusicalElements(std::string_view line);

/// @brief Musical elements divided by non-whitespace glyphs (0 for blank lines).
double musicalRatio(std::string_view line);

// ---------------------------------------------------------------------------
// Line tests
// ---------------------------------------------------------------------------

/// @brief Content line: contains '|' or at least 3 musical elements.
bool isContentLine(std::string_view line);

/// @brief Hash line: three or more '#' and nothing else.
bool isHashLine(std::string_view line);

/// @brief Upper annotation line: every token is a marker, slur, ornament or
///        grace cluster, and the line has no barline.
bool isUpperLine(std::string_view line);

/// @brief Lower annotation line: tokens are markers, underscores or
///        syllables, with at least one marker or underscore token.
bool isLowerLine(std::string_view line);

/// @brief Lyrics line: every token is a word (letters plus ' ! . , ? -).
bool isLyricsLine(std::string_view line);

/// @brief Directive keys with defined effects.
bool isKnownDirectiveKey(std::string_view key);

/// @brief Parse "key:value" or "key: value".
/// @param line Source line.
/// @param key Receives the trimmed key.
/// @param value Receives the trimmed value.
/// @return False if the line is not a directive.
bool parseDirectiveLine(std::string_view line, std::string& key, std::string& value);

/// @brief True if every line of the block parses as a directive.
bool isDirectiveBlock(const LineBlock& block);

/// @brief Classify a non-content line of a stave.
/// @param line Source text.
/// @param after_content True for lines below the content line.
/// @return Upper or Text before content; Lower, Lyrics or Text after it.
StaveLineKind classifyAnnotationLine(std::string_view line, bool after_content);

}  // namespace mtext

#endif  // MTEXT_PARSE_LINE_CLASSIFIER_H
