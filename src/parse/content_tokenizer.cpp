/// @file
/// @brief Content line scanning.

#include "parse/content_tokenizer.h"

#include "core/text_utils.h"
#include "notation/pitch_vocabulary.h"

namespace mtext {

namespace {

bool isBarlineGlyph(const std::string& glyph) {
  return glyphIs(glyph, '|') || glyphIs(glyph, ':');
}

ParsedElement makeElement(ElementKind kind, const std::string& value, const SourceLine& line,
                          size_t col) {
  ParsedElement element;
  element.kind = kind;
  element.value = value;
  element.position.row = line.row;
  element.position.col = static_cast<uint32_t>(col);
  element.position.char_index = line.char_offset + static_cast<uint32_t>(col);
  return element;
}

}  // namespace

bool tokenizeContentLine(const SourceLine& line, NotationSystem system,
                         std::vector<ParsedElement>& elements, ParseError& error) {
  std::vector<std::string> glyphs = splitGlyphs(line.text);
  size_t pos = 0;

  while (pos < glyphs.size()) {
    const std::string& glyph = glyphs[pos];

    if (isBarlineGlyph(glyph)) {
      size_t start = pos;
      std::string run;
      while (pos < glyphs.size() && isBarlineGlyph(glyphs[pos])) {
        run += glyphs[pos];
        ++pos;
      }
      if (run == "|" && pos < glyphs.size() &&
          (glyphIs(glyphs[pos], '.') || glyphIs(glyphs[pos], ']'))) {
        run += glyphs[pos];
        ++pos;
      }
      BarlineStyle style = BarlineStyle::Single;
      if (!barlineStyleFromString(run, style)) {
        error.line = line.row + 1;
        error.column = static_cast<uint32_t>(start) + 1;
        error.message = "Malformed barline '" + run + "'";
        return false;
      }
      ParsedElement barline = makeElement(ElementKind::Barline, run, line, start);
      barline.barline_style = style;
      elements.push_back(barline);
      continue;
    }

    if (isSpaceGlyph(glyph)) {
      size_t start = pos;
      std::string run;
      while (pos < glyphs.size() && isSpaceGlyph(glyphs[pos])) {
        run += glyphs[pos];
        ++pos;
      }
      elements.push_back(makeElement(ElementKind::Whitespace, run, line, start));
      continue;
    }

    if (glyphIs(glyph, '\n')) {
      elements.push_back(makeElement(ElementKind::Newline, glyph, line, pos));
      break;
    }

    if (glyphIs(glyph, '-')) {
      elements.push_back(makeElement(ElementKind::Dash, glyph, line, pos));
      ++pos;
      continue;
    }

    if (glyphIs(glyph, '\'')) {
      elements.push_back(makeElement(ElementKind::Symbol, glyph, line, pos));
      ++pos;
      continue;
    }

    Degree degree = Degree::N1;
    size_t len = matchPitch(glyphs, pos, system, degree);
    if (len > 0) {
      std::string symbol;
      for (size_t idx = pos; idx < pos + len; ++idx) symbol += glyphs[idx];
      ParsedElement note = makeElement(ElementKind::Note, symbol, line, pos);
      note.degree = degree;
      note.octave = 0;
      elements.push_back(note);
      pos += len;
      continue;
    }

    elements.push_back(makeElement(ElementKind::Unknown, glyph, line, pos));
    ++pos;
  }
  return true;
}

}  // namespace mtext
