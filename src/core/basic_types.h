// Basic types shared by every music_text parsing stage.

#ifndef MTEXT_CORE_BASIC_TYPES_H
#define MTEXT_CORE_BASIC_TYPES_H

#include <cstdint>
#include <string>

namespace mtext {

/// @brief Location of a token in the source text.
///
/// row and col are 0-based. char_index is the absolute character (code point)
/// offset into the whole input, so back-ends can build spans that line up with
/// the original text.
struct Position {
  uint32_t row = 0;
  uint32_t col = 0;
  uint32_t char_index = 0;

  bool operator==(const Position& other) const {
    return row == other.row && col == other.col && char_index == other.char_index;
  }
  bool operator!=(const Position& other) const { return !(*this == other); }
};

/// Maximum column distance for nearest-note fallback assignment.
constexpr uint32_t kMaxAssignDistance = 5;

// ---------------------------------------------------------------------------
// Notation system
// ---------------------------------------------------------------------------

/// @brief Pitch vocabulary used by a stave's content line.
enum class NotationSystem : uint8_t {
  Number,   ///< 1-7
  Western,  ///< C-B
  Sargam    ///< S R G m P D N (case-sensitive komal/tivra forms)
};

/// @brief Convert NotationSystem to a lowercase string.
const char* notationSystemToString(NotationSystem system);

// ---------------------------------------------------------------------------
// Span roles
// ---------------------------------------------------------------------------

/// @brief Membership of a note inside a slur or beat group.
enum class Role : uint8_t {
  Start,
  Middle,
  End
};

/// @brief Convert Role to a lowercase string ("start", "middle", "end").
const char* roleToString(Role role);

// ---------------------------------------------------------------------------
// Barlines
// ---------------------------------------------------------------------------

/// @brief Barline styles recognised in content lines.
enum class BarlineStyle : uint8_t {
  Single,       ///< |
  Double,       ///< ||
  Final,        ///< |. or |]
  RepeatStart,  ///< |:
  RepeatEnd,    ///< :|
  RepeatBoth    ///< :|:
};

/// @brief Convert BarlineStyle to its canonical source glyph.
const char* barlineStyleToString(BarlineStyle style);

/// @brief Parse a barline glyph run.
/// @param text Glyph run such as "|", "||", ":|".
/// @param out Receives the style on success.
/// @return False if text is not a valid barline.
bool barlineStyleFromString(const std::string& text, BarlineStyle& out);

// ---------------------------------------------------------------------------
// Ornaments
// ---------------------------------------------------------------------------

/// @brief Ornament kinds written on upper lines.
enum class OrnamentType : uint8_t {
  Mordent,  ///< ~
  Trill,    ///< ~~ or tr
  Turn,     ///< U+221E
  Grace     ///< [..] or a digit cluster
};

/// @brief Convert OrnamentType to a lowercase string.
const char* ornamentTypeToString(OrnamentType type);

}  // namespace mtext

#endif  // MTEXT_CORE_BASIC_TYPES_H
