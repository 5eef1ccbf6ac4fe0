/// @file
/// @brief LilyPond source generation from rhythm items.

#include "render/lilypond_renderer.h"

#include <cctype>
#include <vector>

#include "parse/document_parser.h"
#include "render/duration.h"

namespace mtext {

namespace {

std::string escapeQuoted(const std::string& text) {
  std::string result;
  for (char chr : text) {
    if (chr == '"' || chr == '\\') result += '\\';
    result += chr;
  }
  return result;
}

std::string indentLines(const std::string& text, const std::string& prefix) {
  std::string result;
  bool at_line_start = true;
  for (char chr : text) {
    if (at_line_start && chr != '\n') result += prefix;
    result += chr;
    at_line_start = chr == '\n';
  }
  return result;
}

/// @brief Collects the tokens of one stave.
class StaveWriter {
 public:
  explicit StaveWriter(const KeySignature& key_sig) : key_sig_(key_sig) {}

  void write(const Stave& stave) {
    if (!stave.rhythm_items.has_value()) return;
    for (const auto& item : *stave.rhythm_items) {
      switch (item.kind) {
        case ItemKind::Tonic:
          break;
        case ItemKind::Barline:
          tokens_.push_back(lilypondBarline(item.barline_style));
          break;
        case ItemKind::Breathmark:
          tokens_.push_back("\\breathe");
          break;
        case ItemKind::Beat:
          writeBeat(item.beat);
          break;
      }
    }
  }

  std::string music() const {
    std::string body;
    for (size_t idx = 0; idx < tokens_.size(); ++idx) {
      if (idx > 0) body += ' ';
      body += tokens_[idx];
    }
    return body;
  }

  std::string lyrics() const {
    if (!has_syllable_) return "";
    std::string result;
    for (size_t idx = 0; idx < lyrics_.size(); ++idx) {
      if (idx > 0) result += ' ';
      result += lyrics_[idx];
    }
    return result;
  }

 private:
  void writeBeat(const Beat& beat) {
    if (beat.is_tuplet && beat.tuplet_ratio.has_value()) {
      tokens_.push_back("\\tuplet " + std::to_string(beat.tuplet_ratio->first) + "/" +
                        std::to_string(beat.tuplet_ratio->second) + " {");
    }
    for (const auto& element : beat.elements) {
      writeElement(element, beat.is_tuplet ? element.tuplet_duration : element.duration);
    }
    if (beat.is_tuplet && beat.tuplet_ratio.has_value()) tokens_.push_back("}");
  }

  void writeElement(const BeatElement& element, const Fraction& written) {
    std::vector<DurationPart> parts = decomposeDuration(written);
    if (parts.empty()) return;

    if (element.event != EventKind::Note || !element.degree.has_value()) {
      for (const auto& part : parts) tokens_.push_back("r" + lilypondDurationString(part));
      return;
    }

    if (element.tied_to_previous && last_note_ >= 0) {
      tokens_[static_cast<size_t>(last_note_)] += "~";
    }

    std::string pitch = lilypondPitch(spellDegree(*element.degree, element.octave, key_sig_));
    for (size_t idx = 0; idx < parts.size(); ++idx) {
      std::string token = pitch + lilypondDurationString(parts[idx]);
      if (idx + 1 < parts.size()) token += "~";
      if (idx == 0 && element.slur_start) token += "(";
      if (idx + 1 == parts.size() && element.slur_end) token += ")";
      tokens_.push_back(token);
      last_note_ = static_cast<int>(tokens_.size()) - 1;
    }

    if (element.tied_to_previous) return;
    const ParsedChild* syllable = element.syllable();
    if (syllable != nullptr) {
      lyrics_.push_back(lilypondLyric(syllable->text));
      has_syllable_ = true;
    } else {
      lyrics_.push_back("_");
    }
  }

  const KeySignature& key_sig_;
  std::vector<std::string> tokens_;
  std::vector<std::string> lyrics_;
  int last_note_ = -1;
  bool has_syllable_ = false;
};

}  // namespace

std::string lilypondPitch(const SpelledPitch& pitch) {
  std::string result(1, static_cast<char>(std::tolower(spelledPitchLetter(pitch))));
  for (int idx = 0; idx < pitch.alteration; ++idx) result += "is";
  for (int idx = 0; idx < -pitch.alteration; ++idx) result += "es";
  for (int idx = kBaseOctave; idx < pitch.octave; ++idx) result += '\'';
  for (int idx = pitch.octave; idx < kBaseOctave; ++idx) result += ',';
  return result;
}

std::string lilypondKey(const KeySignature& key_sig) {
  SpelledPitch tonic;
  tonic.letter = static_cast<uint8_t>(degreeStep(key_sig.tonic));
  tonic.alteration = static_cast<int8_t>(degreeAlteration(key_sig.tonic));
  tonic.octave = kBaseOctave;
  return "\\key " + lilypondPitch(tonic) + (key_sig.is_minor ? " \\minor" : " \\major");
}

std::string lilypondBarline(BarlineStyle style) {
  switch (style) {
    case BarlineStyle::Single:      return "|";
    case BarlineStyle::Double:      return "\\bar \"||\"";
    case BarlineStyle::Final:       return "\\bar \"|.\"";
    case BarlineStyle::RepeatStart: return "\\bar \".|:\"";
    case BarlineStyle::RepeatEnd:   return "\\bar \":|.\"";
    case BarlineStyle::RepeatBoth:  return "\\bar \":..:\"";
  }
  return "|";
}

std::string lilypondLyric(const std::string& syllable) {
  if (syllable == "_") return "_";
  std::string text = syllable;
  bool hyphenated = !text.empty() && text.back() == '-';
  if (hyphenated) text.pop_back();

  bool needs_quotes = false;
  for (char chr : text) {
    if (chr == '"' || chr == '{' || chr == '}' || chr == '\\' ||
        std::isdigit(static_cast<unsigned char>(chr)) != 0) {
      needs_quotes = true;
    }
  }
  if (needs_quotes) text = "\"" + escapeQuoted(text) + "\"";
  return hyphenated ? text + " --" : text;
}

std::string renderLilypondStave(const Stave& stave, const KeySignature& key_sig,
                                std::string& lyrics) {
  StaveWriter writer(key_sig);
  writer.write(stave);
  lyrics = writer.lyrics();

  std::string result = "\\fixed c' {\n";
  result += "  " + lilypondKey(key_sig) + "\n";
  result += "  \\time 4/4\n";
  result += "  \\autoBeamOff\n";
  std::string body = writer.music();
  if (!body.empty()) result += "  " + body + "\n";
  result += "}";
  return result;
}

std::string renderLilypond(const Document& document, const RenderOptions& options) {
  KeySignature key_sig = effectiveKeySignature(document);

  std::string result = "\\version \"" + options.lilypond_version + "\"\n";

  std::string title = document.title();
  std::string author = document.author();
  if (options.include_header && (!title.empty() || !author.empty())) {
    result += "\n\\header {\n";
    if (!title.empty()) result += "  title = \"" + escapeQuoted(title) + "\"\n";
    if (!author.empty()) result += "  composer = \"" + escapeQuoted(author) + "\"\n";
    result += "}\n";
  }

  bool in_group = false;
  for (const Stave* stave : document.staves()) {
    std::string lyrics;
    std::string music = renderLilypondStave(*stave, key_sig, lyrics);
    if (options.include_lyrics && !lyrics.empty()) {
      music += "\n\\addlyrics { " + lyrics + " }";
    }

    if (stave->begin_multi_stave && !in_group) {
      result += "\n<<\n";
      in_group = true;
    }
    if (in_group) {
      result += indentLines("\\new Staff " + music, "  ") + "\n";
    } else {
      result += "\n" + music + "\n";
    }
    if (stave->end_multi_stave && in_group) {
      result += ">>\n";
      in_group = false;
    }
  }
  if (in_group) result += ">>\n";
  return result;
}

}  // namespace mtext
