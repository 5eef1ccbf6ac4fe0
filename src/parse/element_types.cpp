/// @file
/// @brief String conversions for element and annotation kinds.

#include "parse/element_types.h"

namespace mtext {

const char* childKindToString(ChildKind kind) {
  switch (kind) {
    case ChildKind::OctaveMarker:       return "octave-marker";
    case ChildKind::Ornament:           return "ornament";
    case ChildKind::Syllable:           return "syllable";
    case ChildKind::BeatGroupIndicator: return "beat-group-indicator";
  }
  return "unknown";
}

const char* elementKindToString(ElementKind kind) {
  switch (kind) {
    case ElementKind::Note:       return "note";
    case ElementKind::Rest:       return "rest";
    case ElementKind::Dash:       return "dash";
    case ElementKind::Barline:    return "barline";
    case ElementKind::Whitespace: return "whitespace";
    case ElementKind::Newline:    return "newline";
    case ElementKind::Symbol:     return "breathmark";
    case ElementKind::Unknown:    return "unknown";
    case ElementKind::SlurStart:  return "slur-start";
    case ElementKind::SlurEnd:    return "slur-end";
  }
  return "unknown";
}

const char* annotationKindToString(AnnotationKind kind) {
  switch (kind) {
    case AnnotationKind::OctaveMarker:       return "octave-marker";
    case AnnotationKind::SlurIndicator:      return "slur";
    case AnnotationKind::BeatGroupIndicator: return "beat-group";
    case AnnotationKind::Ornament:           return "ornament";
    case AnnotationKind::Syllable:           return "syllable";
    case AnnotationKind::Space:              return "whitespace";
    case AnnotationKind::Unknown:            return "unknown";
  }
  return "unknown";
}

}  // namespace mtext
