// Key signature parsing and circle-of-fifths utilities for the key directive.

#ifndef MTEXT_HARMONY_KEY_H
#define MTEXT_HARMONY_KEY_H

#include <array>
#include <cstdint>
#include <string>

#include "core/degree.h"

namespace mtext {

/// @brief A key signature combining a spelled tonic and mode.
///
/// The tonic is stored as a Degree read as a Western letter (N1 = C,
/// N2 = D, ..., N7 = B) with its alteration, so Db and C# stay distinct.
struct KeySignature {
  Degree tonic = Degree::N1;
  bool is_minor = false;

  /// @brief Equality comparison.
  bool operator==(const KeySignature& other) const {
    return tonic == other.tonic && is_minor == other.is_minor;
  }

  /// @brief Inequality comparison.
  bool operator!=(const KeySignature& other) const {
    return !(*this == other);
  }
};

/// @brief Per-letter alteration of a key signature, indexed C=0 .. B=6.
using KeyAlterations = std::array<int8_t, 7>;

/// @brief Get the relative major or minor key.
/// @param key_sig The source key signature.
/// @return If major, the relative minor (a minor third below, two letters down).
///         If minor, the relative major (a minor third above, two letters up).
KeySignature getRelative(const KeySignature& key_sig);

/// @brief Position on the circle of fifths.
/// @param key_sig The key signature.
/// @return Number of sharps (positive) or flats (negative). Minor keys use
///         their relative major. Theoretical keys may exceed 7 in magnitude.
int circleOfFifthsPosition(const KeySignature& key_sig);

/// @brief Alteration each letter carries under the key signature.
/// @param key_sig The key signature.
/// @return Alteration per letter (C=0 .. B=6), e.g. D major -> F and C sharp.
KeyAlterations keySignatureAlterations(const KeySignature& key_sig);

/// @brief Semitone offset of the tonic above C (may be -1 for Cb, 12 for B#).
int tonicSemitone(const KeySignature& key_sig);

/// @brief Parse a key signature from a directive value.
/// @param str Value such as "D", "Bb", "F#", "Cs", "Bb major", "Bm", "d minor",
///        "g_minor". Letter case is ignored.
/// @param out Receives the parsed key on success.
/// @return False if the value does not name a tonic.
bool keySignatureFromString(const std::string& str, KeySignature& out);

/// @brief Convert a key signature to a string.
/// @param key_sig The key signature to convert.
/// @return String such as "C_major", "Bb_minor", "F#_major".
std::string keySignatureToString(const KeySignature& key_sig);

/// @brief Spell a tonic as a letter name with accidentals ("C", "Bb", "F#").
std::string tonicToString(Degree tonic);

}  // namespace mtext

#endif  // MTEXT_HARMONY_KEY_H
