/// @file
/// @brief Paragraph walk from raw text to a resolved Document.

#include "parse/document_parser.h"

#include <utility>

#include "core/text_utils.h"
#include "notation/notation_detector.h"
#include "parse/annotation_tokenizer.h"
#include "parse/content_tokenizer.h"
#include "spatial/spatial_assigner.h"

namespace mtext {

namespace {

void setError(ParseError& error, const SourceLine& line, uint32_t column,
              const std::string& message) {
  error.line = line.row + 1;
  error.column = column;
  error.message = message;
}

/// @brief Parse a tala value 0-6.
bool parseTala(const std::string& value, uint8_t& tala) {
  if (value.size() != 1 || value[0] < '0' || value[0] > '6') return false;
  tala = static_cast<uint8_t>(value[0] - '0');
  return true;
}

/// @brief Split leading known directives off the first stave paragraph.
LineBlock peelLeadingDirectives(const LineBlock& block, LineBlock& directives) {
  directives.blank = false;
  LineBlock rest;
  rest.blank = false;
  size_t idx = 0;
  std::string key;
  std::string value;
  for (; idx < block.lines.size(); ++idx) {
    if (!parseDirectiveLine(block.lines[idx].text, key, value) || !isKnownDirectiveKey(key)) break;
    directives.lines.push_back(block.lines[idx]);
  }
  for (; idx < block.lines.size(); ++idx) rest.lines.push_back(block.lines[idx]);
  return rest;
}

/// @brief Spatial assignment and rhythm for a freshly built stave.
bool resolveStave(Stave& stave, const RhythmContext& context, std::vector<std::string>& warnings,
                  ParseError& error) {
  if (!assignSpatial(stave, warnings, error)) return false;
  StaveLine* content = stave.contentLine();
  std::vector<Item> items;
  if (!runRhythmFsm(content->elements, context, items, error)) return false;
  stave.rhythm_items = std::move(items);
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Directives
// ---------------------------------------------------------------------------

bool parseDirectiveBlock(const LineBlock& block, Document& document, ParseError& error) {
  for (const auto& line : block.lines) {
    std::string key;
    std::string value;
    if (!parseDirectiveLine(line.text, key, value)) {
      setError(error, line, 1, "Malformed directive '" + trim(line.text) + "'");
      return false;
    }
    if (!isKnownDirectiveKey(key)) {
      setError(error, line, 1, "Unknown directive '" + key + "'");
      return false;
    }
    std::string lower = toLower(key);
    if (lower == "tala") {
      uint8_t tala = 0;
      if (!parseTala(value, tala)) {
        setError(error, line, 1, "Invalid tala value '" + value + "' (expected 0-6)");
        return false;
      }
    } else if (lower == "key") {
      KeySignature key_sig;
      if (!keySignatureFromString(value, key_sig)) {
        setError(error, line, 1, "Invalid key '" + value + "'");
        return false;
      }
    }
    document.setDirective(key, value);
  }
  return true;
}

bool documentKeySignature(const Document& document, KeySignature& key_sig) {
  key_sig = KeySignature();
  const std::string* value = document.directive("key");
  if (value == nullptr) return false;
  if (!keySignatureFromString(*value, key_sig)) {
    key_sig = KeySignature();
    return false;
  }
  return true;
}

KeySignature effectiveKeySignature(const Document& document) {
  KeySignature key_sig;
  if (documentKeySignature(document, key_sig)) return key_sig;
  return KeySignature();
}

RhythmContext rhythmContextFor(const Document& document) {
  RhythmContext context;
  KeySignature key_sig;
  if (documentKeySignature(document, key_sig)) context.tonic = key_sig.tonic;
  const std::string* tala = document.directive("tala");
  uint8_t value = 0;
  if (tala != nullptr && parseTala(*tala, value)) context.tala = value;
  return context;
}

// ---------------------------------------------------------------------------
// Staves
// ---------------------------------------------------------------------------

bool buildStave(const LineBlock& block, bool force_content, Stave& stave, ParseError& error) {
  size_t content_index = 0;
  size_t content_count = 0;
  if (force_content) {
    content_count = 1;
  } else {
    for (size_t idx = 0; idx < block.lines.size(); ++idx) {
      if (!isContentLine(block.lines[idx].text)) continue;
      ++content_count;
      if (content_count == 1) {
        content_index = idx;
      } else {
        setError(error, block.lines[idx], 1,
                 "Multiple content lines found in stave - only one allowed");
        return false;
      }
    }
  }
  if (content_count == 0) {
    setError(error, block.lines.front(), 1, "No musical content line found in stave");
    return false;
  }

  const SourceLine& content_source = block.lines[content_index];
  stave.notation_system = detectNotationSystem(content_source.text);
  stave.start_row = block.lines.front().row;

  for (size_t idx = 0; idx < block.lines.size(); ++idx) {
    const SourceLine& source = block.lines[idx];
    if (idx > 0) stave.source += '\n';
    stave.source += source.text;

    StaveLine line;
    line.text = source.text;
    line.row = source.row;
    line.char_offset = source.char_offset;

    if (idx == content_index) {
      line.kind = StaveLineKind::Content;
      if (!tokenizeContentLine(source, stave.notation_system, line.elements, error)) return false;
    } else if (isHashLine(source.text)) {
      line.kind = StaveLineKind::Text;
      if (idx == 0 && idx < content_index) stave.begin_multi_stave = true;
      if (idx > content_index) stave.end_multi_stave = true;
    } else {
      line.kind = classifyAnnotationLine(source.text, idx > content_index);
      switch (line.kind) {
        case StaveLineKind::Upper:
          line.annotations = tokenizeUpperLine(source);
          break;
        case StaveLineKind::Lower:
          line.annotations = tokenizeLowerLine(source);
          break;
        case StaveLineKind::Lyrics:
          line.annotations = tokenizeLyricsLine(source);
          break;
        case StaveLineKind::Text:
        case StaveLineKind::Content:
          break;
      }
    }
    stave.lines.push_back(std::move(line));
  }
  return true;
}

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

bool parseDocument(std::string_view input, Document& document,
                   std::vector<std::string>& warnings, ParseError& error) {
  document = Document();
  document.source = std::string(input);

  std::vector<SourceLine> lines = splitSourceLines(input);
  std::vector<LineBlock> blocks = splitBlocks(lines);

  // Single-line input: parse as a stave only if it reads as music.
  std::vector<const LineBlock*> paragraphs;
  for (const auto& block : blocks) {
    if (!block.blank) paragraphs.push_back(&block);
  }
  bool single_line = paragraphs.size() == 1 && paragraphs.front()->lines.size() == 1;
  if (single_line) {
    const LineBlock& block = *paragraphs.front();
    if (isDirectiveBlock(block)) return parseDirectiveBlock(block, document, error);
    if (musicalRatio(block.lines.front().text) < kSingleLineMusicalThreshold) return true;

    Stave stave;
    if (!buildStave(block, true, stave, error)) return false;
    if (!resolveStave(stave, rhythmContextFor(document), warnings, error)) return false;
    for (const auto& each : blocks) {
      DocumentElement element;
      if (each.blank) {
        element.kind = DocumentElementKind::BlankLines;
        element.blank_line_count = static_cast<uint32_t>(each.lines.size());
      } else {
        element.kind = DocumentElementKind::Stave;
        element.stave = stave;
      }
      document.elements.push_back(std::move(element));
    }
    return true;
  }

  bool seen_stave = false;
  for (const auto& block : blocks) {
    if (block.blank) {
      DocumentElement element;
      element.kind = DocumentElementKind::BlankLines;
      element.blank_line_count = static_cast<uint32_t>(block.lines.size());
      document.elements.push_back(std::move(element));
      continue;
    }

    if (isDirectiveBlock(block)) {
      if (seen_stave) {
        setError(error, block.lines.front(), 1, "Directives must appear before the first stave");
        return false;
      }
      if (!parseDirectiveBlock(block, document, error)) return false;
      continue;
    }

    LineBlock stave_block = block;
    if (!seen_stave) {
      LineBlock directives;
      stave_block = peelLeadingDirectives(block, directives);
      if (!directives.lines.empty() && !parseDirectiveBlock(directives, document, error)) {
        return false;
      }
    }

    DocumentElement element;
    element.kind = DocumentElementKind::Stave;
    if (!buildStave(stave_block, false, element.stave, error)) return false;
    if (!resolveStave(element.stave, rhythmContextFor(document), warnings, error)) return false;
    document.elements.push_back(std::move(element));
    seen_stave = true;
  }
  return true;
}

}  // namespace mtext
