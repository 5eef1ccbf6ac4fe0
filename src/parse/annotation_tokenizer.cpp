/// @file
/// @brief Upper, lower and lyrics line scanning.

#include "parse/annotation_tokenizer.h"

#include <cctype>

#include "core/text_utils.h"

namespace mtext {

namespace {

constexpr const char* kBullet = "\xE2\x80\xA2";    // •
constexpr const char* kInfinity = "\xE2\x88\x9E";  // ∞

bool isDigitGlyph(const std::string& glyph) {
  return glyph.size() == 1 && std::isdigit(static_cast<unsigned char>(glyph[0])) != 0;
}

/// @brief Incremental builder that tracks columns for one source line.
class LineScanner {
 public:
  explicit LineScanner(const SourceLine& line)
      : line_(line), glyphs_(splitGlyphs(line.text)) {}

  bool done() const { return pos_ >= glyphs_.size(); }
  size_t pos() const { return pos_; }
  const std::string& peek(size_t offset = 0) const {
    static const std::string kEmpty;
    return pos_ + offset < glyphs_.size() ? glyphs_[pos_ + offset] : kEmpty;
  }

  /// @brief Consume glyphs while pred holds and return the run.
  template <typename Pred>
  std::string takeWhile(Pred pred) {
    std::string run;
    while (!done() && pred(glyphs_[pos_])) {
      run += glyphs_[pos_];
      ++pos_;
    }
    return run;
  }

  std::string take(size_t count) {
    std::string run;
    for (size_t idx = 0; idx < count && !done(); ++idx) {
      run += glyphs_[pos_];
      ++pos_;
    }
    return run;
  }

  /// @brief Find the glyph index of ch at or after the cursor, or npos.
  size_t findFromCursor(char chr) const {
    for (size_t idx = pos_; idx < glyphs_.size(); ++idx) {
      if (glyphIs(glyphs_[idx], chr)) return idx;
    }
    return std::string::npos;
  }

  /// @brief Append an element covering [start, cursor).
  AnnotationElement& emit(std::vector<AnnotationElement>& out, AnnotationKind kind,
                          const std::string& text, size_t start) {
    AnnotationElement element;
    element.kind = kind;
    element.value = text;
    element.position.row = line_.row;
    element.position.col = static_cast<uint32_t>(start);
    element.position.char_index = line_.char_offset + static_cast<uint32_t>(start);
    element.text_length = static_cast<uint32_t>(glyphCount(text));
    element.end_col = element.position.col + (element.text_length > 0 ? element.text_length - 1 : 0);
    if (kind == AnnotationKind::Space || kind == AnnotationKind::Unknown) {
      element.state = MarkerState::Inert;
    }
    out.push_back(element);
    return out.back();
  }

 private:
  const SourceLine& line_;
  std::vector<std::string> glyphs_;
  size_t pos_ = 0;
};

/// @brief Emit one glyph as Unknown, merging with an adjacent Unknown.
void emitUnknown(LineScanner& scanner, std::vector<AnnotationElement>& out) {
  size_t start = scanner.pos();
  std::string glyph = scanner.take(1);
  if (!out.empty() && out.back().kind == AnnotationKind::Unknown &&
      out.back().end_col + 1 == start && out.back().value.has_value()) {
    *out.back().value += glyph;
    out.back().text_length += 1;
    out.back().end_col += 1;
    return;
  }
  scanner.emit(out, AnnotationKind::Unknown, glyph, start);
}

bool scanSpace(LineScanner& scanner, std::vector<AnnotationElement>& out) {
  if (!isSpaceGlyph(scanner.peek())) return false;
  size_t start = scanner.pos();
  std::string run = scanner.takeWhile(isSpaceGlyph);
  scanner.emit(out, AnnotationKind::Space, run, start);
  return true;
}

bool scanOctaveMarker(LineScanner& scanner, std::vector<AnnotationElement>& out, bool upper) {
  int8_t value = octaveMarkerValue(scanner.peek(), upper);
  if (value == 0) return false;
  size_t start = scanner.pos();
  std::string glyph = scanner.take(1);
  scanner.emit(out, AnnotationKind::OctaveMarker, glyph, start).octave_value = value;
  return true;
}

/// @brief Underscore run: span indicator if two or more, Unknown otherwise.
bool scanUnderscores(LineScanner& scanner, std::vector<AnnotationElement>& out,
                     AnnotationKind span_kind) {
  if (!glyphIs(scanner.peek(), '_')) return false;
  size_t start = scanner.pos();
  std::string run = scanner.takeWhile([](const std::string& glyph) { return glyphIs(glyph, '_'); });
  scanner.emit(out, run.size() >= 2 ? span_kind : AnnotationKind::Unknown, run, start);
  return true;
}

/// @brief Split a word into syllables at hyphens, keeping trailing hyphens.
void emitSyllables(LineScanner& scanner, std::vector<AnnotationElement>& out,
                   const std::vector<std::string>& word, size_t word_start) {
  std::string part;
  size_t part_start = word_start;
  for (size_t idx = 0; idx < word.size(); ++idx) {
    if (part.empty()) part_start = word_start + idx;
    part += word[idx];
    bool is_hyphen = glyphIs(word[idx], '-');
    bool last = idx + 1 == word.size();
    if ((is_hyphen && !last) || last) {
      // A part made of hyphens only carries no syllable.
      if (part.find_first_not_of('-') != std::string::npos) {
        scanner.emit(out, AnnotationKind::Syllable, part, part_start);
      }
      part.clear();
    }
  }
}

}  // namespace

int8_t octaveMarkerValue(const std::string& glyph, bool upper) {
  int8_t value = 0;
  if (glyph == "." || glyph == kBullet) {
    value = 1;
  } else if (glyph == ":") {
    value = 2;
  } else if (glyph == "*") {
    value = 3;
  } else if (glyph == "'") {
    value = 4;
  }
  return upper ? value : static_cast<int8_t>(-value);
}

std::vector<AnnotationElement> tokenizeUpperLine(const SourceLine& line) {
  std::vector<AnnotationElement> out;
  LineScanner scanner(line);

  while (!scanner.done()) {
    if (scanSpace(scanner, out)) continue;
    if (scanOctaveMarker(scanner, out, true)) continue;
    if (scanUnderscores(scanner, out, AnnotationKind::SlurIndicator)) continue;

    size_t start = scanner.pos();
    const std::string& glyph = scanner.peek();

    if (glyphIs(glyph, '~')) {
      std::string run =
          scanner.takeWhile([](const std::string& next) { return glyphIs(next, '~'); });
      scanner.emit(out, AnnotationKind::Ornament, run, start).ornament =
          run.size() >= 2 ? OrnamentType::Trill : OrnamentType::Mordent;
      continue;
    }
    if (glyphIs(glyph, 't') && glyphIs(scanner.peek(1), 'r')) {
      std::string run = scanner.take(2);
      scanner.emit(out, AnnotationKind::Ornament, run, start).ornament = OrnamentType::Trill;
      continue;
    }
    if (glyph == kInfinity) {
      std::string run = scanner.take(1);
      scanner.emit(out, AnnotationKind::Ornament, run, start).ornament = OrnamentType::Turn;
      continue;
    }
    if (glyphIs(glyph, '[')) {
      size_t close = scanner.findFromCursor(']');
      if (close != std::string::npos) {
        std::string run = scanner.take(close - start + 1);
        scanner.emit(out, AnnotationKind::Ornament, run, start).ornament = OrnamentType::Grace;
        continue;
      }
    }
    if (isDigitGlyph(glyph)) {
      std::string run = scanner.takeWhile(isDigitGlyph);
      scanner.emit(out, AnnotationKind::Ornament, run, start).ornament = OrnamentType::Grace;
      continue;
    }

    emitUnknown(scanner, out);
  }
  return out;
}

std::vector<AnnotationElement> tokenizeLowerLine(const SourceLine& line) {
  std::vector<AnnotationElement> out;
  LineScanner scanner(line);

  while (!scanner.done()) {
    if (scanSpace(scanner, out)) continue;
    if (scanUnderscores(scanner, out, AnnotationKind::BeatGroupIndicator)) continue;

    if (isAsciiLetter(scanner.peek())) {
      size_t start = scanner.pos();
      std::vector<std::string> word;
      while (!scanner.done() &&
             (isAsciiLetter(scanner.peek()) || glyphIs(scanner.peek(), '-') ||
              glyphIs(scanner.peek(), '\''))) {
        word.push_back(scanner.take(1));
      }
      emitSyllables(scanner, out, word, start);
      continue;
    }

    if (scanOctaveMarker(scanner, out, false)) continue;
    emitUnknown(scanner, out);
  }
  return out;
}

std::vector<AnnotationElement> tokenizeLyricsLine(const SourceLine& line) {
  std::vector<AnnotationElement> out;
  LineScanner scanner(line);

  while (!scanner.done()) {
    if (scanSpace(scanner, out)) continue;
    size_t start = scanner.pos();
    std::vector<std::string> word;
    while (!scanner.done() && !isSpaceGlyph(scanner.peek())) {
      word.push_back(scanner.take(1));
    }
    emitSyllables(scanner, out, word, start);
  }
  return out;
}

}  // namespace mtext
