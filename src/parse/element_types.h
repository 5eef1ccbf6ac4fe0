// Content-line elements, annotation elements and note children.

#ifndef MTEXT_PARSE_ELEMENT_TYPES_H
#define MTEXT_PARSE_ELEMENT_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/degree.h"
#include "core/fraction.h"

namespace mtext {

// ---------------------------------------------------------------------------
// Note children
// ---------------------------------------------------------------------------

/// @brief Kind of annotation attached to a note by the spatial assigner.
enum class ChildKind : uint8_t {
  OctaveMarker,
  Ornament,
  Syllable,
  BeatGroupIndicator
};

/// @brief Convert ChildKind to a kebab-case string.
const char* childKindToString(ChildKind kind);

/// @brief Annotation owned by a note.
///
/// text holds the source payload moved out of the annotation element.
/// distance is the row offset of the source line from the content line
/// (negative above, positive below).
struct ParsedChild {
  ChildKind kind = ChildKind::OctaveMarker;
  std::string text;
  int8_t distance = 0;
  int8_t octave_value = 0;                     ///< OctaveMarker only.
  OrnamentType ornament = OrnamentType::Mordent;  ///< Ornament only.
  uint32_t span = 0;                           ///< BeatGroupIndicator only.
};

// ---------------------------------------------------------------------------
// Content-line elements
// ---------------------------------------------------------------------------

/// @brief Tag of a ParsedElement.
enum class ElementKind : uint8_t {
  Note,
  Rest,       ///< Not emitted by the tokenizer; leading dashes become rests.
  Dash,
  Barline,
  Whitespace,
  Newline,
  Symbol,     ///< Breath mark "'".
  Unknown,
  SlurStart,  ///< Synthetic, inserted by the spatial assigner.
  SlurEnd     ///< Synthetic, inserted by the spatial assigner.
};

/// @brief Convert ElementKind to a kebab-case string.
const char* elementKindToString(ElementKind kind);

/// @brief One element of a content line.
///
/// Fields beyond kind, value and position are meaningful only for the kinds
/// noted on them.
struct ParsedElement {
  ElementKind kind = ElementKind::Unknown;
  std::string value;
  Position position;

  // Note (and Dash once a tie has been inferred).
  std::optional<Degree> degree;
  int8_t octave = 0;
  std::vector<ParsedChild> children;
  std::optional<Fraction> duration;
  std::optional<Role> slur;
  std::optional<Role> beat_group;
  bool in_slur = false;
  bool in_beat_group = false;

  // Barline.
  BarlineStyle barline_style = BarlineStyle::Single;
  std::optional<uint8_t> tala;

  bool isNote() const { return kind == ElementKind::Note; }
  bool isSynthetic() const {
    return kind == ElementKind::SlurStart || kind == ElementKind::SlurEnd;
  }
};

// ---------------------------------------------------------------------------
// Upper / lower / lyrics line elements
// ---------------------------------------------------------------------------

/// @brief Tag of an AnnotationElement.
enum class AnnotationKind : uint8_t {
  OctaveMarker,
  SlurIndicator,       ///< Upper "__" run.
  BeatGroupIndicator,  ///< Lower "__" run.
  Ornament,
  Syllable,
  Space,
  Unknown
};

/// @brief Convert AnnotationKind to a kebab-case string.
const char* annotationKindToString(AnnotationKind kind);

/// @brief Resolution state of an annotation after spatial assignment.
enum class MarkerState : uint8_t {
  Pending,   ///< Not yet processed.
  Consumed,  ///< Payload moved into a content element.
  Dropped,   ///< Payload discarded with a warning.
  Inert      ///< Space or Unknown; never consumed.
};

/// @brief One token of an upper, lower or lyrics line.
///
/// value carries the source text until the spatial assigner moves it into a
/// note; afterwards it is std::nullopt and state records where it went.
/// text_length and end_col survive consumption so back-ends can still build
/// spans.
struct AnnotationElement {
  AnnotationKind kind = AnnotationKind::Unknown;
  std::optional<std::string> value;
  Position position;
  uint32_t end_col = 0;      ///< Inclusive last column.
  uint32_t text_length = 0;  ///< Glyph count of the original payload.
  int8_t octave_value = 0;   ///< OctaveMarker: signed octave shift.
  OrnamentType ornament = OrnamentType::Mordent;
  MarkerState state = MarkerState::Pending;

  /// @brief True for kinds the spatial assigner must consume or drop.
  bool isMarker() const {
    return kind != AnnotationKind::Space && kind != AnnotationKind::Unknown;
  }
};

}  // namespace mtext

#endif  // MTEXT_PARSE_ELEMENT_TYPES_H
