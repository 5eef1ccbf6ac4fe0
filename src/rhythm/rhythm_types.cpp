/// @file
/// @brief Rhythm item helpers.

#include "rhythm/rhythm_types.h"

namespace mtext {

const char* eventKindToString(EventKind kind) {
  switch (kind) {
    case EventKind::Note:    return "note";
    case EventKind::Rest:    return "rest";
    case EventKind::Unknown: return "unknown";
  }
  return "unknown";
}

const char* itemKindToString(ItemKind kind) {
  switch (kind) {
    case ItemKind::Beat:       return "beat";
    case ItemKind::Barline:    return "barline";
    case ItemKind::Breathmark: return "breathmark";
    case ItemKind::Tonic:      return "tonic";
  }
  return "unknown";
}

const ParsedChild* BeatElement::syllable() const {
  for (const auto& child : children) {
    if (child.kind == ChildKind::Syllable) return &child;
  }
  return nullptr;
}

}  // namespace mtext
