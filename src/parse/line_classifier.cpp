/// @file
/// @brief Line classification heuristics.

#include "parse/line_classifier.h"

#include <cctype>
#include <cstring>

#include "core/text_utils.h"
#include "notation/pitch_vocabulary.h"

namespace mtext {

namespace {

bool isDigitGlyph(const std::string& glyph) {
  return glyph.size() == 1 && std::isdigit(static_cast<unsigned char>(glyph[0])) != 0;
}

bool isSargamLowercase(char chr) {
  return std::strchr("srgmpdn", chr) != nullptr;
}

/// Glyphs that may appear in an upper-line marker or slur token.
bool isUpperMarkerGlyph(const std::string& glyph) {
  return glyph == "." || glyph == "\xE2\x80\xA2" /* • */ || glyph == ":" || glyph == "*" ||
         glyph == "'" || glyph == "_" || glyph == "~" || glyph == "\xE2\x88\x9E" /* ∞ */;
}

/// Glyphs that may appear in a lower-line marker or beat-group token.
bool isLowerMarkerGlyph(const std::string& glyph) {
  return glyph == "." || glyph == "\xE2\x80\xA2" || glyph == ":" || glyph == "*" ||
         glyph == "'" || glyph == "_";
}

bool allGlyphs(const std::vector<std::string>& glyphs, bool (*pred)(const std::string&)) {
  if (glyphs.empty()) return false;
  for (const auto& glyph : glyphs) {
    if (!pred(glyph)) return false;
  }
  return true;
}

bool isUpperToken(const std::string& token) {
  std::vector<std::string> glyphs = splitGlyphs(token);
  if (allGlyphs(glyphs, isUpperMarkerGlyph)) return true;
  if (token == "tr") return true;
  if (token.size() >= 2 && token.front() == '[' && token.back() == ']') return true;
  return allGlyphs(glyphs, isDigitGlyph);
}

bool isSyllableToken(const std::string& token) {
  if (token.empty() || std::isalpha(static_cast<unsigned char>(token[0])) == 0) return false;
  for (char chr : token) {
    if (std::isalpha(static_cast<unsigned char>(chr)) == 0 && chr != '-' && chr != '\'') {
      return false;
    }
  }
  return true;
}

bool isLyricsToken(const std::string& token) {
  bool has_letter = false;
  for (char chr : token) {
    if (std::isalpha(static_cast<unsigned char>(chr)) != 0) {
      has_letter = true;
    } else if (std::strchr("'!.,?-", chr) == nullptr) {
      return false;
    }
  }
  return has_letter;
}

/// @brief A whitespace-separated word of two or more musical characters.
bool isMusicalWord(const std::string& word) {
  if (word.size() < 2) return false;
  for (char chr : word) {
    if (std::strchr("1234567CDEFGABSRMPNsrgmpdn-#b", chr) == nullptr) return false;
  }
  return true;
}

}  // namespace

std::vector<SourceLine> splitSourceLines(std::string_view input) {
  std::vector<SourceLine> lines;
  uint32_t row = 0;
  uint32_t offset = 0;
  size_t pos = 0;
  while (pos <= input.size()) {
    size_t newline = input.find('\n', pos);
    bool last = newline == std::string_view::npos;
    std::string_view raw = input.substr(pos, last ? std::string_view::npos : newline - pos);
    // A trailing newline does not open another line.
    if (last && raw.empty() && pos > 0) break;

    SourceLine line;
    line.row = row;
    line.char_offset = offset;
    line.text = std::string(raw);
    // Offsets count the raw line including '\r' so char_index matches the input.
    offset += static_cast<uint32_t>(glyphCount(raw)) + 1;
    if (!line.text.empty() && line.text.back() == '\r') line.text.pop_back();
    lines.push_back(line);

    ++row;
    if (last) break;
    pos = newline + 1;
  }
  return lines;
}

std::vector<LineBlock> splitBlocks(const std::vector<SourceLine>& lines) {
  std::vector<LineBlock> blocks;
  for (const auto& line : lines) {
    bool blank = isBlank(line.text);
    if (blocks.empty() || blocks.back().blank != blank) {
      LineBlock block;
      block.blank = blank;
      blocks.push_back(block);
    }
    blocks.back().lines.push_back(line);
  }
  return blocks;
}

// ---------------------------------------------------------------------------
// Musical element heuristics
// ---------------------------------------------------------------------------

bool isPartOfNumber(const std::vector<std::string>& glyphs, size_t start, size_t len) {
  auto disqualifies = [](const std::string& glyph) {
    return glyph == "0" || glyph == "8" || glyph == "9";
  };
  if (start > 0 && disqualifies(glyphs[start - 1])) return true;
  if (start + len < glyphs.size() && disqualifies(glyphs[start + len])) return true;
  return false;
}

bool isPartOfEnglishWord(const std::vector<std::string>& glyphs, size_t start, size_t len) {
  auto disqualifies = [](const std::string& glyph) {
    if (glyph.size() != 1) return false;
    char chr = glyph[0];
    return std::islower(static_cast<unsigned char>(chr)) != 0 && !isSargamLowercase(chr);
  };
  if (start > 0 && disqualifies(glyphs[start - 1])) return true;
  if (start + len < glyphs.size() && disqualifies(glyphs[start + len])) return true;
  return false;
}

uint32_t countMusicalElements(std::string_view line) {
  std::vector<std::string> glyphs = splitGlyphs(line);
  uint32_t count = 0;
  size_t pos = 0;
  while (pos < glyphs.size()) {
    if (glyphIs(glyphs[pos], '-')) {
      ++count;
      ++pos;
      continue;
    }
    size_t len = matchAnyPitch(glyphs, pos);
    if (len == 0) {
      ++pos;
      continue;
    }
    bool rejected = isDigitGlyph(glyphs[pos]) ? isPartOfNumber(glyphs, pos, len)
                                              : isPartOfEnglishWord(glyphs, pos, len);
    if (rejected) {
      ++pos;
      continue;
    }
    ++count;
    pos += len;
  }
  return count;
}

double musicalRatio(std::string_view line) {
  uint32_t non_space = 0;
  for (const auto& glyph : splitGlyphs(line)) {
    if (!isSpaceGlyph(glyph) && !glyphIs(glyph, '\r')) ++non_space;
  }
  if (non_space == 0) return 0.0;
  return static_cast<double>(countMusicalElements(line)) / static_cast<double>(non_space);
}

// ---------------------------------------------------------------------------
// Line tests
// ---------------------------------------------------------------------------

bool isContentLine(std::string_view line) {
  if (line.find('|') != std::string_view::npos) return true;
  return countMusicalElements(line) >= 3;
}

bool isHashLine(std::string_view line) {
  std::string trimmed = trim(line);
  if (trimmed.size() < 3) return false;
  for (char chr : trimmed) {
    if (chr != '#') return false;
  }
  return true;
}

bool isUpperLine(std::string_view line) {
  if (line.find('|') != std::string_view::npos || isHashLine(line)) return false;
  std::vector<std::string> tokens = splitWhitespace(line);
  if (tokens.empty()) return false;
  for (const auto& token : tokens) {
    if (!isUpperToken(token)) return false;
  }
  return true;
}

bool isLowerLine(std::string_view line) {
  if (line.find('|') != std::string_view::npos) return false;
  std::vector<std::string> tokens = splitWhitespace(line);
  bool has_marker = false;
  for (const auto& token : tokens) {
    if (allGlyphs(splitGlyphs(token), isLowerMarkerGlyph)) {
      has_marker = true;
    } else if (!isSyllableToken(token)) {
      return false;
    }
  }
  return has_marker;
}

bool isLyricsLine(std::string_view line) {
  std::vector<std::string> tokens = splitWhitespace(line);
  if (tokens.empty()) return false;
  for (const auto& token : tokens) {
    if (!isLyricsToken(token)) return false;
  }
  return true;
}

bool isKnownDirectiveKey(std::string_view key) {
  std::string lower = toLower(key);
  return lower == "title" || lower == "author" || lower == "composer" || lower == "key" ||
         lower == "tala" || lower == "tempo";
}

bool parseDirectiveLine(std::string_view line, std::string& key, std::string& value) {
  size_t colon = line.find(':');
  if (colon == std::string_view::npos) return false;

  std::string candidate_key = trim(line.substr(0, colon));
  if (candidate_key.empty()) return false;
  if (std::isalpha(static_cast<unsigned char>(candidate_key[0])) == 0) return false;
  if (candidate_key.find('|') != std::string::npos) return false;
  for (const auto& word : splitWhitespace(candidate_key)) {
    if (isMusicalWord(word)) return false;
  }
  if (isContentLine(candidate_key)) return false;
  // "S: R G m" reads as music unless the key is a recognised directive.
  if (!isKnownDirectiveKey(candidate_key) && isContentLine(line)) return false;

  key = candidate_key;
  value = trim(line.substr(colon + 1));
  return true;
}

bool isDirectiveBlock(const LineBlock& block) {
  if (block.blank || block.lines.empty()) return false;
  std::string key;
  std::string value;
  for (const auto& line : block.lines) {
    if (!parseDirectiveLine(line.text, key, value)) return false;
  }
  return true;
}

StaveLineKind classifyAnnotationLine(std::string_view line, bool after_content) {
  if (!after_content) {
    return isUpperLine(line) ? StaveLineKind::Upper : StaveLineKind::Text;
  }
  if (isLowerLine(line)) return StaveLineKind::Lower;
  if (isLyricsLine(line)) return StaveLineKind::Lyrics;
  return StaveLineKind::Text;
}

}  // namespace mtext
