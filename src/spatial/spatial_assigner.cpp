/// @file
/// @brief Spatial assignment passes: octave markers, ornaments, slurs, beat
/// groups and syllables.

#include "spatial/spatial_assigner.h"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace mtext {

namespace {

std::string describeLocation(const Position& position) {
  return "line " + std::to_string(position.row + 1) + " column " +
         std::to_string(position.col + 1);
}

std::string describeColumns(const AnnotationElement& span) {
  return std::to_string(span.position.col + 1) + "-" + std::to_string(span.end_col + 1);
}

int8_t rowDistance(uint32_t row, uint32_t content_row) {
  return static_cast<int8_t>(static_cast<int>(row) - static_cast<int>(content_row));
}

uint32_t columnDistance(uint32_t lhs, uint32_t rhs) {
  return lhs > rhs ? lhs - rhs : rhs - lhs;
}

/// @brief Distance from a column to a closed column range (0 inside it).
uint32_t distanceToSpan(uint32_t col, uint32_t start, uint32_t end) {
  if (col < start) return start - col;
  if (col > end) return col - end;
  return 0;
}

/// @brief Digit 0-6 that may name a tala above a barline.
bool isTalaDigit(const AnnotationElement& annotation) {
  if (!annotation.value.has_value() || annotation.value->size() != 1) return false;
  char chr = (*annotation.value)[0];
  return chr >= '0' && chr <= '6';
}

/// @brief Runs the passes over one stave.
class SpatialAssigner {
 public:
  SpatialAssigner(Stave& stave, StaveLine& content, std::vector<std::string>& warnings)
      : stave_(stave), content_(content), warnings_(warnings) {
    for (size_t idx = 0; idx < content_.elements.size(); ++idx) {
      if (content_.elements[idx].isNote()) note_indices_.push_back(idx);
    }
    upper_marked_.assign(content_.elements.size(), false);
    lower_marked_.assign(content_.elements.size(), false);
    ornamented_.assign(content_.elements.size(), false);
  }

  bool run(ParseError& error) {
    assignOctaveMarkers();
    assignOrnaments();
    assignSlurs();
    assignBeatGroups();
    distributeSyllables();
    if (!crossCheckOctaves(error)) return false;
    if (!verifyResolved(error)) return false;
    insertSlurElements();
    return true;
  }

 private:
  struct Marker {
    AnnotationElement* annotation;
    bool upper;
  };

  struct SlurSpan {
    size_t first;  ///< Element index of the Start note.
    size_t last;   ///< Element index of the End note.
    std::string text;
  };

  // -------------------------------------------------------------------------
  // Line and note lookup
  // -------------------------------------------------------------------------

  /// @brief Annotation lines of one kind, nearest to the content line first.
  std::vector<StaveLine*> linesNearestFirst(StaveLineKind kind) {
    std::vector<StaveLine*> lines;
    for (auto& line : stave_.lines) {
      if (line.kind == kind) lines.push_back(&line);
    }
    uint32_t content_row = content_.row;
    std::sort(lines.begin(), lines.end(), [content_row](const StaveLine* lhs, const StaveLine* rhs) {
      return columnDistance(lhs->row, content_row) < columnDistance(rhs->row, content_row);
    });
    return lines;
  }

  /// @brief Annotation lines of the given kinds in source order.
  std::vector<StaveLine*> linesInRowOrder(StaveLineKind kind, StaveLineKind other) {
    std::vector<StaveLine*> lines;
    for (auto& line : stave_.lines) {
      if (line.kind == kind || line.kind == other) lines.push_back(&line);
    }
    return lines;
  }

  std::vector<StaveLine*> linesInRowOrder(StaveLineKind kind) {
    return linesInRowOrder(kind, kind);
  }

  /// @brief Element index of the note at exactly col, or -1.
  int noteAt(uint32_t col) const {
    for (size_t idx : note_indices_) {
      if (content_.elements[idx].position.col == col) return static_cast<int>(idx);
    }
    return -1;
  }

  /// @brief Nearest note within kMaxAssignDistance accepted by pred; left wins ties.
  template <typename Pred>
  int nearestNote(uint32_t col, Pred pred) const {
    int best = -1;
    uint32_t best_distance = kMaxAssignDistance + 1;
    for (size_t idx : note_indices_) {
      if (!pred(idx)) continue;
      uint32_t distance = columnDistance(content_.elements[idx].position.col, col);
      // Notes are visited left to right, so strict < keeps the left one on ties.
      if (distance < best_distance) {
        best = static_cast<int>(idx);
        best_distance = distance;
      }
    }
    return best;
  }

  /// @brief Element indices of the notes with a column in [start, end].
  std::vector<size_t> notesInSpan(uint32_t start, uint32_t end) const {
    std::vector<size_t> covered;
    for (size_t idx : note_indices_) {
      uint32_t col = content_.elements[idx].position.col;
      if (col >= start && col <= end) covered.push_back(idx);
    }
    return covered;
  }

  /// @brief Notes between the two nearest notes within range of a span.
  std::vector<size_t> nearestNotePair(uint32_t start, uint32_t end) const {
    std::vector<std::pair<uint32_t, size_t>> candidates;
    for (size_t idx : note_indices_) {
      uint32_t distance = distanceToSpan(content_.elements[idx].position.col, start, end);
      if (distance <= kMaxAssignDistance) candidates.emplace_back(distance, idx);
    }
    if (candidates.size() < 2) return {};
    // Stable on element index, so equal distances favour the left note.
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const std::pair<uint32_t, size_t>& lhs,
                        const std::pair<uint32_t, size_t>& rhs) { return lhs.first < rhs.first; });
    size_t low = std::min(candidates[0].second, candidates[1].second);
    size_t high = std::max(candidates[0].second, candidates[1].second);

    std::vector<size_t> group;
    for (size_t idx : note_indices_) {
      if (idx >= low && idx <= high) group.push_back(idx);
    }
    return group;
  }

  // -------------------------------------------------------------------------
  // Consumption
  // -------------------------------------------------------------------------

  /// @brief Move the annotation's text into a new child.
  ParsedChild takeChild(ChildKind kind, AnnotationElement& source) {
    ParsedChild child;
    child.kind = kind;
    child.text = std::move(*source.value);
    child.distance = rowDistance(source.position.row, content_.row);
    source.value.reset();
    source.state = MarkerState::Consumed;
    return child;
  }

  void drop(AnnotationElement& source, const std::string& warning) {
    warnings_.push_back(warning);
    source.value.reset();
    source.state = MarkerState::Dropped;
  }

  // -------------------------------------------------------------------------
  // Octave markers
  // -------------------------------------------------------------------------

  void attachOctaveMarker(const Marker& marker, size_t idx) {
    ParsedElement& note = content_.elements[idx];
    int8_t shift = marker.annotation->octave_value;
    ParsedChild child = takeChild(ChildKind::OctaveMarker, *marker.annotation);
    child.octave_value = shift;
    note.octave = static_cast<int8_t>(note.octave + shift);
    note.children.push_back(std::move(child));
    (marker.upper ? upper_marked_ : lower_marked_)[idx] = true;
  }

  void assignOctaveMarkers() {
    std::vector<Marker> markers;
    for (StaveLine* line : linesNearestFirst(StaveLineKind::Upper)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind == AnnotationKind::OctaveMarker) markers.push_back({&annotation, true});
      }
    }
    for (StaveLine* line : linesNearestFirst(StaveLineKind::Lower)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind == AnnotationKind::OctaveMarker) markers.push_back({&annotation, false});
      }
    }

    // Pass 1: direct column match. The inner-most marker on a side wins.
    std::vector<Marker> unmatched;
    for (const auto& marker : markers) {
      int idx = noteAt(marker.annotation->position.col);
      if (idx < 0) {
        unmatched.push_back(marker);
        continue;
      }
      const std::vector<bool>& marked = marker.upper ? upper_marked_ : lower_marked_;
      if (marked[static_cast<size_t>(idx)]) {
        drop(*marker.annotation,
             "Octave marker '" + *marker.annotation->value + "' at " +
                 describeLocation(marker.annotation->position) +
                 " is shadowed by a closer marker on the same note and will be ignored");
        continue;
      }
      attachOctaveMarker(marker, static_cast<size_t>(idx));
    }

    // Pass 2: nearest note that is still at octave 0.
    for (const auto& marker : unmatched) {
      const std::vector<bool>& marked = marker.upper ? upper_marked_ : lower_marked_;
      int idx = nearestNote(marker.annotation->position.col, [&](size_t candidate) {
        return content_.elements[candidate].octave == 0 && !marked[candidate];
      });
      if (idx < 0) {
        drop(*marker.annotation, "Octave marker '" + *marker.annotation->value + "' at " +
                                     describeLocation(marker.annotation->position) +
                                     " has no target note");
        continue;
      }
      attachOctaveMarker(marker, static_cast<size_t>(idx));
    }
  }

  // -------------------------------------------------------------------------
  // Ornaments and tala digits
  // -------------------------------------------------------------------------

  void attachOrnament(AnnotationElement& annotation, size_t idx) {
    OrnamentType type = annotation.ornament;
    ParsedChild child = takeChild(ChildKind::Ornament, annotation);
    child.ornament = type;
    content_.elements[idx].children.push_back(std::move(child));
    ornamented_[idx] = true;
  }

  /// @brief Consume a tala digit sitting exactly above a barline.
  bool assignTala(AnnotationElement& annotation) {
    if (annotation.ornament != OrnamentType::Grace || !isTalaDigit(annotation)) return false;
    for (auto& element : content_.elements) {
      if (element.kind == ElementKind::Barline &&
          element.position.col == annotation.position.col) {
        element.tala = static_cast<uint8_t>((*annotation.value)[0] - '0');
        annotation.value.reset();
        annotation.state = MarkerState::Consumed;
        return true;
      }
    }
    return false;
  }

  void assignOrnaments() {
    std::vector<AnnotationElement*> unmatched;
    for (StaveLine* line : linesNearestFirst(StaveLineKind::Upper)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind != AnnotationKind::Ornament) continue;
        if (assignTala(annotation)) continue;
        int idx = noteAt(annotation.position.col);
        if (idx >= 0 && !ornamented_[static_cast<size_t>(idx)]) {
          attachOrnament(annotation, static_cast<size_t>(idx));
        } else {
          unmatched.push_back(&annotation);
        }
      }
    }

    for (AnnotationElement* annotation : unmatched) {
      int idx = nearestNote(annotation->position.col,
                            [&](size_t candidate) { return !ornamented_[candidate]; });
      if (idx < 0) {
        drop(*annotation, "Ornament '" + *annotation->value + "' at " +
                              describeLocation(annotation->position) + " has no target note");
        continue;
      }
      attachOrnament(*annotation, static_cast<size_t>(idx));
    }
  }

  // -------------------------------------------------------------------------
  // Slurs and beat groups
  // -------------------------------------------------------------------------

  static void assignRoles(std::vector<ParsedElement>& elements, const std::vector<size_t>& covered,
                          bool slur) {
    for (size_t pos = 0; pos < covered.size(); ++pos) {
      Role role = Role::Middle;
      if (pos == 0) {
        role = Role::Start;
      } else if (pos + 1 == covered.size()) {
        role = Role::End;
      }
      ParsedElement& note = elements[covered[pos]];
      if (slur) {
        note.slur = role;
        note.in_slur = true;
      } else {
        note.beat_group = role;
        note.in_beat_group = true;
      }
    }
  }

  void assignSlurs() {
    for (StaveLine* line : linesInRowOrder(StaveLineKind::Upper)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind != AnnotationKind::SlurIndicator) continue;
        std::string columns = describeColumns(annotation);
        std::vector<size_t> covered = notesInSpan(annotation.position.col, annotation.end_col);

        if (covered.empty()) {
          drop(annotation, "Slur at columns " + columns + " doesn't align with any notes");
          continue;
        }
        if (covered.size() == 1) {
          drop(annotation, "Slur at columns " + columns +
                               " only covers one note and will be ignored (slurs require 2+ notes)");
          continue;
        }
        bool overlaps = std::any_of(covered.begin(), covered.end(), [this](size_t idx) {
          return content_.elements[idx].in_slur;
        });
        if (overlaps) {
          drop(annotation,
               "Slur at columns " + columns + " overlaps an earlier slur and will be ignored");
          continue;
        }

        assignRoles(content_.elements, covered, true);
        SlurSpan span;
        span.first = covered.front();
        span.last = covered.back();
        span.text = std::move(*annotation.value);
        annotation.value.reset();
        annotation.state = MarkerState::Consumed;
        slurs_.push_back(std::move(span));
      }
    }
  }

  void assignBeatGroups() {
    for (StaveLine* line : linesInRowOrder(StaveLineKind::Lower)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind != AnnotationKind::BeatGroupIndicator) continue;
        std::string columns = describeColumns(annotation);
        std::vector<size_t> covered = notesInSpan(annotation.position.col, annotation.end_col);
        if (covered.size() < 2) {
          covered = nearestNotePair(annotation.position.col, annotation.end_col);
        }
        if (covered.size() < 2) {
          drop(annotation, "Beat group at columns " + columns +
                               " has fewer than two notes nearby and will be ignored");
          continue;
        }
        bool overlaps = std::any_of(covered.begin(), covered.end(), [this](size_t idx) {
          return content_.elements[idx].in_beat_group;
        });
        if (overlaps) {
          drop(annotation, "Beat group at columns " + columns +
                               " overlaps an earlier beat group and will be ignored");
          continue;
        }

        assignRoles(content_.elements, covered, false);
        uint32_t span = annotation.text_length;
        ParsedChild child = takeChild(ChildKind::BeatGroupIndicator, annotation);
        child.span = span;
        content_.elements[covered.front()].children.push_back(std::move(child));
      }
    }
  }

  // -------------------------------------------------------------------------
  // Syllables
  // -------------------------------------------------------------------------

  void distributeSyllables() {
    std::vector<AnnotationElement*> syllables;
    for (StaveLine* line : linesInRowOrder(StaveLineKind::Lower, StaveLineKind::Lyrics)) {
      for (auto& annotation : line->annotations) {
        if (annotation.kind == AnnotationKind::Syllable) syllables.push_back(&annotation);
      }
    }

    size_t next = 0;
    bool slur_has_syllable = false;
    int8_t slur_distance = 0;
    for (size_t idx : note_indices_) {
      ParsedElement& note = content_.elements[idx];
      bool takes_syllable = !note.slur.has_value() || *note.slur == Role::Start;

      if (takes_syllable) {
        bool took = next < syllables.size();
        if (took) {
          ParsedChild child = takeChild(ChildKind::Syllable, *syllables[next]);
          slur_distance = child.distance;
          note.children.push_back(std::move(child));
          ++next;
        }
        if (note.slur.has_value()) slur_has_syllable = took;
        continue;
      }

      if (slur_has_syllable) {
        ParsedChild continuation;
        continuation.kind = ChildKind::Syllable;
        continuation.text = "_";
        continuation.distance = slur_distance;
        note.children.push_back(std::move(continuation));
      }
    }

    for (; next < syllables.size(); ++next) {
      AnnotationElement& leftover = *syllables[next];
      drop(leftover, "Syllable '" + *leftover.value + "' at " +
                         describeLocation(leftover.position) + " has no note to attach to");
    }
  }

  // -------------------------------------------------------------------------
  // Post-conditions
  // -------------------------------------------------------------------------

  bool crossCheckOctaves(ParseError& error) const {
    for (size_t idx : note_indices_) {
      const ParsedElement& note = content_.elements[idx];
      int sum = 0;
      for (const auto& child : note.children) {
        if (child.kind == ChildKind::OctaveMarker) sum += child.octave_value;
      }
      if (sum != note.octave) {
        error.line = note.position.row + 1;
        error.column = note.position.col + 1;
        error.message = "Octave of note '" + note.value + "' does not match its octave markers";
        return false;
      }
    }
    return true;
  }

  bool verifyResolved(ParseError& error) const {
    for (const auto& line : stave_.lines) {
      for (const auto& annotation : line.annotations) {
        if (!annotation.isMarker()) continue;
        bool resolved = (annotation.state == MarkerState::Consumed ||
                         annotation.state == MarkerState::Dropped) &&
                        !annotation.value.has_value();
        if (!resolved) {
          error.line = annotation.position.row + 1;
          error.column = annotation.position.col + 1;
          error.message = std::string("Unresolved ") + annotationKindToString(annotation.kind) +
                          " annotation after spatial assignment";
          return false;
        }
      }
    }
    return true;
  }

  /// @brief Insert SlurStart before and SlurEnd after every slur.
  void insertSlurElements() {
    std::sort(slurs_.begin(), slurs_.end(),
              [](const SlurSpan& lhs, const SlurSpan& rhs) { return lhs.first > rhs.first; });
    std::vector<ParsedElement>& elements = content_.elements;
    for (auto& span : slurs_) {
      ParsedElement slur_end;
      slur_end.kind = ElementKind::SlurEnd;
      slur_end.position = elements[span.last].position;
      elements.insert(elements.begin() + static_cast<std::ptrdiff_t>(span.last) + 1,
                      std::move(slur_end));

      ParsedElement slur_start;
      slur_start.kind = ElementKind::SlurStart;
      slur_start.value = std::move(span.text);
      slur_start.position = elements[span.first].position;
      elements.insert(elements.begin() + static_cast<std::ptrdiff_t>(span.first),
                      std::move(slur_start));
    }
  }

  Stave& stave_;
  StaveLine& content_;
  std::vector<std::string>& warnings_;
  std::vector<size_t> note_indices_;
  std::vector<bool> upper_marked_;
  std::vector<bool> lower_marked_;
  std::vector<bool> ornamented_;
  std::vector<SlurSpan> slurs_;
};

}  // namespace

bool assignSpatial(Stave& stave, std::vector<std::string>& warnings, ParseError& error) {
  StaveLine* content = stave.contentLine();
  if (content == nullptr) return true;
  SpatialAssigner assigner(stave, *content, warnings);
  return assigner.run(error);
}

}  // namespace mtext
