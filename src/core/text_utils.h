// UTF-8 and whitespace helpers for line-oriented scanning.

#ifndef MTEXT_CORE_TEXT_UTILS_H
#define MTEXT_CORE_TEXT_UTILS_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mtext {

/// @brief Split a UTF-8 string into one string per code point.
///
/// Columns used throughout the parser are indices into this vector. Invalid
/// lead bytes are kept as single-byte glyphs.
std::vector<std::string> splitGlyphs(std::string_view text);

/// @brief Number of code points in a UTF-8 string.
size_t glyphCount(std::string_view text);

/// @brief True for ASCII space and tab glyphs.
bool isSpaceGlyph(const std::string& glyph);

/// @brief True if the glyph is a single ASCII character equal to chr.
inline bool glyphIs(const std::string& glyph, char chr) {
  return glyph.size() == 1 && glyph[0] == chr;
}

/// @brief True if the glyph is a single ASCII letter.
bool isAsciiLetter(const std::string& glyph);

/// @brief True if the string contains only spaces, tabs and carriage returns.
bool isBlank(std::string_view text);

/// @brief Strip leading and trailing ASCII whitespace.
std::string trim(std::string_view text);

/// @brief Split on runs of ASCII whitespace.
std::vector<std::string> splitWhitespace(std::string_view text);

/// @brief ASCII lowercase copy.
std::string toLower(std::string_view text);

}  // namespace mtext

#endif  // MTEXT_CORE_TEXT_UTILS_H
