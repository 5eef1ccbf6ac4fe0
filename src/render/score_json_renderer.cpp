/// @file
/// @brief Score JSON generation with beaming and key-aware accidentals.

#include "render/score_json_renderer.h"

#include <cctype>

#include "core/json_helpers.h"
#include "parse/document_parser.h"
#include "render/duration.h"

namespace mtext {

namespace {

/// @brief One drawn note or rest before serialization.
struct ScoreNote {
  bool is_rest = false;
  std::string key;
  DurationPart duration;
  std::string accidental;
  bool tied = false;  ///< Tied to the previous note.
  bool beam_start = false;
  bool beam_end = false;
  bool slur_start = false;
  bool slur_end = false;
  bool has_syllable = false;
  std::string syllable;
};

class ScoreWriter {
 public:
  ScoreWriter(JsonWriter& writer, const KeySignature& key_sig, bool include_lyrics)
      : writer_(writer),
        key_sig_(key_sig),
        signature_(keySignatureAlterations(key_sig)),
        include_lyrics_(include_lyrics) {}

  void writeStave(const Stave& stave) {
    writer_.beginObject();
    writer_.key("notes");
    writer_.beginArray();
    if (stave.rhythm_items.has_value()) {
      for (const auto& item : *stave.rhythm_items) writeItem(item);
    }
    writer_.endArray();
    writer_.field("key_signature", vexflowKeySignature(key_sig_));
    writer_.endObject();
  }

 private:
  void writeItem(const Item& item) {
    switch (item.kind) {
      case ItemKind::Tonic:
        break;
      case ItemKind::Barline:
        writer_.beginObject();
        writer_.field("type", "BarLine");
        writer_.field("bar_type", vexflowBarType(item.barline_style));
        if (item.tala.has_value()) {
          writer_.field("tala", static_cast<int>(*item.tala));
        }
        writer_.endObject();
        break;
      case ItemKind::Breathmark:
        writer_.beginObject();
        writer_.field("type", "Symbol");
        writer_.field("symbol", "breathmark");
        writer_.endObject();
        break;
      case ItemKind::Beat:
        writeBeat(item.beat);
        break;
    }
  }

  void writeBeat(const Beat& beat) {
    std::vector<ScoreNote> notes = buildNotes(beat);
    if (!beat.is_tuplet || !beat.tuplet_ratio.has_value()) {
      for (const auto& note : notes) writeNote(note);
      return;
    }
    writer_.beginObject();
    writer_.field("type", "Tuplet");
    writer_.field("divisions", beat.divisions);
    writer_.key("ratio");
    writer_.beginArray();
    writer_.value(beat.tuplet_ratio->first);
    writer_.value(beat.tuplet_ratio->second);
    writer_.endArray();
    writer_.key("notes");
    writer_.beginArray();
    for (const auto& note : notes) writeNote(note);
    writer_.endArray();
    writer_.endObject();
  }

  std::vector<ScoreNote> buildNotes(const Beat& beat) const {
    std::vector<ScoreNote> notes;
    for (const auto& element : beat.elements) {
      Fraction written = beat.is_tuplet ? element.tuplet_duration : element.duration;
      std::vector<DurationPart> parts = decomposeDuration(written);
      bool pitched = element.event == EventKind::Note && element.degree.has_value();

      for (size_t idx = 0; idx < parts.size(); ++idx) {
        ScoreNote note;
        note.duration = parts[idx];
        note.is_rest = !pitched;
        if (pitched) {
          SpelledPitch pitch = spellDegree(*element.degree, element.octave, key_sig_);
          note.key = vexflowKey(pitch);
          note.accidental = vexflowAccidental(pitch, signature_);
          note.tied = idx > 0 || element.tied_to_previous;
          note.slur_start = idx == 0 && element.slur_start;
          note.slur_end = idx + 1 == parts.size() && element.slur_end;
          const ParsedChild* syllable = element.syllable();
          if (include_lyrics_ && idx == 0 && !element.tied_to_previous && syllable != nullptr) {
            note.has_syllable = true;
            note.syllable = syllable->text;
          }
        }
        notes.push_back(note);
      }
    }

    std::vector<bool> beamable;
    for (const auto& note : notes) {
      beamable.push_back(!note.is_rest && note.duration.denominator >= 8);
    }
    std::pair<int, int> run = findBeamRun(beamable);
    if (run.first >= 0) {
      notes[static_cast<size_t>(run.first)].beam_start = true;
      notes[static_cast<size_t>(run.second)].beam_end = true;
    }
    return notes;
  }

  void writeNote(const ScoreNote& note) {
    writer_.beginObject();
    writer_.field("type", note.is_rest ? "Rest" : "Note");
    if (!note.is_rest) {
      writer_.key("keys");
      writer_.beginArray();
      writer_.value(note.key);
      writer_.endArray();
    }
    writer_.field("duration", vexflowDurationCode(note.duration));
    writer_.field("dots", static_cast<int>(note.duration.dots));
    if (!note.is_rest) {
      writer_.key("accidentals");
      writer_.beginArray();
      if (!note.accidental.empty()) writer_.value(note.accidental);
      writer_.endArray();
      writer_.field("tied", note.tied);
      writer_.field("beam_start", note.beam_start);
      writer_.field("beam_end", note.beam_end);
      if (note.slur_start) {
        writer_.field("slur_start", true);
      }
      if (note.slur_end) {
        writer_.field("slur_end", true);
      }
      if (note.has_syllable) {
        writer_.field("syllable", note.syllable);
      }
    }
    writer_.endObject();
  }

  JsonWriter& writer_;
  const KeySignature& key_sig_;
  KeyAlterations signature_;
  bool include_lyrics_;
};

}  // namespace

std::string vexflowKey(const SpelledPitch& pitch) {
  std::string result(1, static_cast<char>(std::tolower(spelledPitchLetter(pitch))));
  result += alterationToString(pitch.alteration);
  result += "/" + std::to_string(pitch.octave);
  return result;
}

std::string vexflowAccidental(const SpelledPitch& pitch, const KeyAlterations& signature) {
  int expected = signature[pitch.letter % 7];
  if (pitch.alteration == expected) return "";
  if (pitch.alteration == 0) return "n";
  return alterationToString(pitch.alteration);
}

const char* vexflowBarType(BarlineStyle style) {
  switch (style) {
    case BarlineStyle::Single:      return "single";
    case BarlineStyle::Double:      return "double";
    case BarlineStyle::Final:       return "end";
    case BarlineStyle::RepeatStart: return "repeat-start";
    case BarlineStyle::RepeatEnd:   return "repeat-end";
    case BarlineStyle::RepeatBoth:  return "repeat-both";
  }
  return "single";
}

std::string vexflowKeySignature(const KeySignature& key_sig) {
  return tonicToString(key_sig.tonic) + (key_sig.is_minor ? "m" : "");
}

std::pair<int, int> findBeamRun(const std::vector<bool>& beamable) {
  int best_start = -1;
  int best_length = 0;
  int run_start = -1;
  for (size_t idx = 0; idx <= beamable.size(); ++idx) {
    bool open = idx < beamable.size() && beamable[idx];
    if (open && run_start < 0) run_start = static_cast<int>(idx);
    if (!open && run_start >= 0) {
      int length = static_cast<int>(idx) - run_start;
      if (length > best_length) {
        best_start = run_start;
        best_length = length;
      }
      run_start = -1;
    }
  }
  if (best_length < 2) return {-1, -1};
  return {best_start, best_start + best_length - 1};
}

std::string renderScoreJson(const Document& document, const RenderOptions& options) {
  KeySignature key_sig = effectiveKeySignature(document);
  JsonWriter writer;
  writer.beginObject();

  writer.key("staves");
  writer.beginArray();
  ScoreWriter score(writer, key_sig, options.include_lyrics);
  for (const Stave* stave : document.staves()) score.writeStave(*stave);
  writer.endArray();

  std::string title = document.title();
  if (!title.empty()) {
    writer.field("title", title);
  }
  std::string author = document.author();
  if (!author.empty()) {
    writer.field("author", author);
  }
  writer.field("time_signature", "4/4");
  writer.field("clef", "treble");
  writer.field("key_signature", vexflowKeySignature(key_sig));

  writer.endObject();
  return options.pretty_json ? writer.toPrettyString() : writer.toString();
}

}  // namespace mtext
