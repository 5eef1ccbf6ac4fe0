/// @file
/// @brief Mealy machine from content elements to beats, barlines and breath marks.

#include "rhythm/rhythm_fsm.h"

#include <utility>

#include "core/text_utils.h"

namespace mtext {

const char* fsmStateToString(FsmState state) {
  switch (state) {
    case FsmState::S0:              return "s0";
    case FsmState::CollectingPitch: return "collecting_pitch";
    case FsmState::CollectingRests: return "collecting_rests";
    case FsmState::Halt:            return "halt";
  }
  return "unknown";
}

uint32_t tupletPowerOfTwo(uint32_t divisions) {
  uint32_t power = 1;
  while (power * 2 < divisions) power *= 2;
  return power < 2 ? 2 : power;
}

void finalizeBeat(Beat& beat) {
  uint32_t divisions = 0;
  for (const auto& element : beat.elements) divisions += element.subdivisions;
  beat.divisions = divisions;
  beat.is_tuplet = beat.elements.size() > 1 && divisions > 1 && !isPowerOfTwo(divisions);

  if (beat.is_tuplet) {
    uint32_t power = tupletPowerOfTwo(divisions);
    beat.tuplet_ratio = std::make_pair(divisions, power);
    for (auto& element : beat.elements) {
      element.duration = Fraction(element.subdivisions, divisions);
      element.tuplet_duration = Fraction(element.subdivisions, 4 * static_cast<int64_t>(power));
      element.tuplet_display_duration = element.tuplet_duration;
    }
    return;
  }

  beat.tuplet_ratio.reset();
  for (auto& element : beat.elements) {
    element.duration = Fraction(element.subdivisions, 4 * static_cast<int64_t>(divisions));
    element.tuplet_duration = element.duration;
    element.tuplet_display_duration.reset();
  }
}

namespace {

/// @brief One pass of the machine over a content line.
class RhythmFsm {
 public:
  RhythmFsm(std::vector<ParsedElement>& elements, const RhythmContext& context,
            std::vector<Item>& items)
      : elements_(elements), context_(context), items_(items) {}

  bool run(ParseError& error) {
    if (context_.tonic.has_value()) {
      Item tonic;
      tonic.kind = ItemKind::Tonic;
      tonic.tonic = *context_.tonic;
      items_.push_back(tonic);
    }

    for (size_t idx = 0; idx < elements_.size(); ++idx) {
      const ParsedElement& element = elements_[idx];
      switch (element.kind) {
        case ElementKind::Note:
          onNote(idx);
          break;
        case ElementKind::Dash:
          onDash(idx);
          break;
        case ElementKind::Rest:
          onRest(idx);
          break;
        case ElementKind::Unknown:
          onUnknown(idx);
          break;
        case ElementKind::Whitespace:
        case ElementKind::Newline:
          if (!finishBeat(error)) return false;
          break;
        case ElementKind::Barline:
          if (!finishBeat(error)) return false;
          emitBarline(element);
          break;
        case ElementKind::Symbol:
          if (!finishBeat(error)) return false;
          emitBreathmark(element);
          break;
        case ElementKind::SlurStart:
          pending_slur_start_ = true;
          break;
        case ElementKind::SlurEnd:
          markSlurEnd();
          break;
      }
    }

    if (!finishBeat(error)) return false;
    state_ = FsmState::Halt;
    return true;
  }

 private:
  struct Pitch {
    Degree degree;
    int8_t octave;
  };

  // -------------------------------------------------------------------------
  // Input events
  // -------------------------------------------------------------------------

  void onNote(size_t idx) {
    const ParsedElement& note = elements_[idx];
    BeatElement element;
    element.event = EventKind::Note;
    element.degree = note.degree;
    element.octave = note.octave;
    element.value = note.value;
    element.position = note.position;
    element.slur = note.slur;
    element.beat_group = note.beat_group;
    element.children = note.children;

    if (state_ == FsmState::S0) {
      startBeat(idx, std::move(element));
    } else {
      // Tie consume: the note re-declares the pitch the pending dash carried.
      if (pending_tie_ && last_note_.has_value() && note.degree == last_note_->degree &&
          note.octave == last_note_->octave) {
        pending_tie_ = false;
      }
      appendElement(idx, std::move(element));
    }
    state_ = FsmState::CollectingPitch;

    extension_chain_active_ = note.degree.has_value();
    if (note.degree.has_value()) {
      last_note_ = Pitch{*note.degree, note.octave};
    }
  }

  void onDash(size_t idx) {
    if (state_ != FsmState::S0) {
      beat_.elements.back().subdivisions += 1;
      extendSpan(idx);
      return;
    }

    ParsedElement& dash = elements_[idx];
    BeatElement element;
    element.value = dash.value;
    element.position = dash.position;

    if (extension_chain_active_ && last_note_.has_value()) {
      element.event = EventKind::Note;
      element.degree = last_note_->degree;
      element.octave = last_note_->octave;
      element.tied_to_previous = true;
      dash.degree = last_note_->degree;
      dash.octave = last_note_->octave;
      startBeat(idx, std::move(element));
      beat_.tied_to_previous = true;
      pending_tie_ = true;
      state_ = FsmState::CollectingPitch;
      return;
    }

    element.event = EventKind::Rest;
    startBeat(idx, std::move(element));
    state_ = FsmState::CollectingRests;
  }

  void onRest(size_t idx) {
    const ParsedElement& rest = elements_[idx];
    BeatElement element;
    element.event = EventKind::Rest;
    element.value = rest.value;
    element.position = rest.position;
    if (state_ == FsmState::S0) {
      startBeat(idx, std::move(element));
      state_ = FsmState::CollectingRests;
    } else {
      appendElement(idx, std::move(element));
    }
  }

  void onUnknown(size_t idx) {
    const ParsedElement& unknown = elements_[idx];
    BeatElement element;
    element.event = EventKind::Unknown;
    element.value = unknown.value;
    element.position = unknown.position;
    if (state_ == FsmState::S0) {
      startBeat(idx, std::move(element));
      state_ = FsmState::CollectingPitch;
    } else {
      appendElement(idx, std::move(element));
    }
    clearChain();
  }

  void emitBarline(const ParsedElement& barline) {
    Item item;
    item.kind = ItemKind::Barline;
    item.barline_style = barline.barline_style;
    item.tala = barline.tala.has_value() ? barline.tala : context_.tala;
    item.position = barline.position;
    items_.push_back(item);
  }

  void emitBreathmark(const ParsedElement& symbol) {
    Item item;
    item.kind = ItemKind::Breathmark;
    item.position = symbol.position;
    items_.push_back(item);
    clearChain();
  }

  void markSlurEnd() {
    BeatElement* last = lastBeatElement();
    if (last != nullptr) last->slur_end = true;
  }

  // -------------------------------------------------------------------------
  // Beat bookkeeping
  // -------------------------------------------------------------------------

  void startBeat(size_t idx, BeatElement element) {
    beat_ = Beat();
    sources_.clear();
    const Position& position = elements_[idx].position;
    beat_.row = position.row;
    beat_.start_col = position.col;
    beat_.end_col = position.col;
    beat_start_ = position;
    appendElement(idx, std::move(element));
  }

  void appendElement(size_t idx, BeatElement element) {
    if (pending_slur_start_) {
      element.slur_start = true;
      pending_slur_start_ = false;
    }
    beat_.elements.push_back(std::move(element));
    sources_.push_back(idx);
    extendSpan(idx);
  }

  void extendSpan(size_t idx) {
    const ParsedElement& element = elements_[idx];
    beat_.end_col = element.position.col + static_cast<uint32_t>(glyphCount(element.value));
  }

  bool finishBeat(ParseError& error) {
    if (state_ != FsmState::CollectingPitch && state_ != FsmState::CollectingRests) return true;

    finalizeBeat(beat_);
    if (beat_.divisions == 0 || beat_.elements.empty()) {
      error.line = beat_start_.row + 1;
      error.column = beat_start_.col + 1;
      error.message = "Beat with zero divisions";
      return false;
    }
    for (size_t pos = 0; pos < beat_.elements.size(); ++pos) {
      const BeatElement& element = beat_.elements[pos];
      if (!element.duration.isPositive() || !element.tuplet_duration.isPositive()) {
        error.line = element.position.row + 1;
        error.column = element.position.col + 1;
        error.message = "Beat element '" + element.value + "' has a non-positive duration";
        return false;
      }
      ParsedElement& source = elements_[sources_[pos]];
      if (source.kind == ElementKind::Note || source.kind == ElementKind::Dash ||
          source.kind == ElementKind::Rest) {
        source.duration = element.duration;
      }
    }

    Item item;
    item.kind = ItemKind::Beat;
    item.position = beat_start_;
    item.beat = std::move(beat_);
    items_.push_back(std::move(item));

    beat_ = Beat();
    sources_.clear();
    pending_tie_ = false;
    state_ = FsmState::S0;
    return true;
  }

  /// @brief Last element of the open beat, or of the last finished beat.
  BeatElement* lastBeatElement() {
    if (state_ != FsmState::S0 && !beat_.elements.empty()) return &beat_.elements.back();
    for (auto item = items_.rbegin(); item != items_.rend(); ++item) {
      if (item->kind == ItemKind::Beat && !item->beat.elements.empty()) {
        return &item->beat.elements.back();
      }
    }
    return nullptr;
  }

  void clearChain() {
    extension_chain_active_ = false;
    last_note_.reset();
  }

  std::vector<ParsedElement>& elements_;
  const RhythmContext& context_;
  std::vector<Item>& items_;

  FsmState state_ = FsmState::S0;
  Beat beat_;
  std::vector<size_t> sources_;  ///< Element index behind each beat element.
  Position beat_start_;

  bool extension_chain_active_ = false;
  std::optional<Pitch> last_note_;
  bool pending_tie_ = false;
  bool pending_slur_start_ = false;
};

}  // namespace

bool runRhythmFsm(std::vector<ParsedElement>& elements, const RhythmContext& context,
                  std::vector<Item>& items, ParseError& error) {
  RhythmFsm fsm(elements, context, items);
  return fsm.run(error);
}

}  // namespace mtext
