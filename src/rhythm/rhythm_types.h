// Output alphabet of the rhythm FSM: beats, barlines, breath marks, tonic.

#ifndef MTEXT_RHYTHM_RHYTHM_TYPES_H
#define MTEXT_RHYTHM_RHYTHM_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "core/degree.h"
#include "core/fraction.h"
#include "parse/element_types.h"

namespace mtext {

/// @brief What a beat element sounds as.
enum class EventKind : uint8_t {
  Note,
  Rest,
  Unknown
};

/// @brief Convert EventKind to a lowercase string.
const char* eventKindToString(EventKind kind);

/// @brief One pitched, rest or unknown event inside a beat.
///
/// duration is the element's share of the beat (see finalizeBeat for the
/// tuplet and non-tuplet formulas). tuplet_duration is what a tuplet wrapper
/// displays; outside tuplets it equals duration.
struct BeatElement {
  EventKind event = EventKind::Rest;
  std::optional<Degree> degree;
  int8_t octave = 0;
  uint32_t subdivisions = 1;
  Fraction duration;
  Fraction tuplet_duration;
  std::optional<Fraction> tuplet_display_duration;
  std::string value;
  Position position;

  bool tied_to_previous = false;  ///< Leading dash that continues the previous note.
  bool slur_start = false;
  bool slur_end = false;
  std::optional<Role> slur;
  std::optional<Role> beat_group;
  std::vector<ParsedChild> children;

  /// @brief First syllable child, or nullptr.
  const ParsedChild* syllable() const;
};

/// @brief A run of subdivisions delimited by whitespace, barlines or breath marks.
struct Beat {
  uint32_t divisions = 0;
  std::vector<BeatElement> elements;
  bool tied_to_previous = false;
  bool is_tuplet = false;
  std::optional<std::pair<uint32_t, uint32_t>> tuplet_ratio;
  uint32_t row = 0;
  uint32_t start_col = 0;  ///< First source column of the beat.
  uint32_t end_col = 0;    ///< One past the last source column.
};

/// @brief Tag of a rhythm Item.
enum class ItemKind : uint8_t {
  Beat,
  Barline,
  Breathmark,
  Tonic
};

/// @brief Convert ItemKind to a lowercase string.
const char* itemKindToString(ItemKind kind);

/// @brief One output symbol of the rhythm FSM.
struct Item {
  ItemKind kind = ItemKind::Beat;
  Beat beat;                                          ///< Beat only.
  BarlineStyle barline_style = BarlineStyle::Single;  ///< Barline only.
  std::optional<uint8_t> tala;                        ///< Barline only.
  Degree tonic = Degree::N1;                          ///< Tonic only.
  Position position;
};

}  // namespace mtext

#endif  // MTEXT_RHYTHM_RHYTHM_TYPES_H
