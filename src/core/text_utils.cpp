/// @file
/// @brief UTF-8 glyph splitting and whitespace utilities.

#include "core/text_utils.h"

#include <cctype>

namespace mtext {

namespace {

/// @brief Byte length of a UTF-8 sequence from its lead byte.
size_t sequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

bool isAsciiSpace(char chr) {
  return chr == ' ' || chr == '\t' || chr == '\r' || chr == '\n';
}

}  // namespace

std::vector<std::string> splitGlyphs(std::string_view text) {
  std::vector<std::string> glyphs;
  glyphs.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
    if (pos + len > text.size()) len = 1;
    glyphs.emplace_back(text.substr(pos, len));
    pos += len;
  }
  return glyphs;
}

size_t glyphCount(std::string_view text) {
  size_t count = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
    if (pos + len > text.size()) len = 1;
    pos += len;
    ++count;
  }
  return count;
}

bool isSpaceGlyph(const std::string& glyph) {
  return glyph.size() == 1 && (glyph[0] == ' ' || glyph[0] == '\t');
}

bool isAsciiLetter(const std::string& glyph) {
  return glyph.size() == 1 && std::isalpha(static_cast<unsigned char>(glyph[0])) != 0;
}

bool isBlank(std::string_view text) {
  for (char chr : text) {
    if (!isAsciiSpace(chr)) return false;
  }
  return true;
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && isAsciiSpace(text[begin])) ++begin;
  while (end > begin && isAsciiSpace(text[end - 1])) --end;
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> splitWhitespace(std::string_view text) {
  std::vector<std::string> words;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && isAsciiSpace(text[pos])) ++pos;
    size_t start = pos;
    while (pos < text.size() && !isAsciiSpace(text[pos])) ++pos;
    if (pos > start) words.emplace_back(text.substr(start, pos - start));
  }
  return words;
}

std::string toLower(std::string_view text) {
  std::string result;
  result.reserve(text.size());
  for (char chr : text) {
    result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(chr))));
  }
  return result;
}

}  // namespace mtext
