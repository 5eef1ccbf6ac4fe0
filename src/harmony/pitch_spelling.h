// Degree-to-letter spelling under a declared key.

#ifndef MTEXT_HARMONY_PITCH_SPELLING_H
#define MTEXT_HARMONY_PITCH_SPELLING_H

#include <cstdint>
#include <string>

#include "core/degree.h"
#include "harmony/key.h"

namespace mtext {

/// Octave number of the content line's unmarked octave (C4 = middle C).
constexpr int kBaseOctave = 4;

/// @brief A Western pitch: letter, alteration and scientific octave.
struct SpelledPitch {
  uint8_t letter = 0;      ///< 0 = C .. 6 = B.
  int8_t alteration = 0;   ///< -2..2.
  int octave = kBaseOctave;

  bool operator==(const SpelledPitch& other) const {
    return letter == other.letter && alteration == other.alteration && octave == other.octave;
  }
  bool operator!=(const SpelledPitch& other) const { return !(*this == other); }
};

/// @brief Transpose a degree into the key and spell it.
///
/// The degree's semitone (major-scale table plus alteration) is shifted by the
/// tonic's semitone offset. The resulting pitch class takes the spelling the
/// key signature gives it when one letter of the signature sounds it;
/// otherwise the fixed table C C# D Eb E F F# G Ab A Bb B applies.
/// @param degree Scale degree with accidental.
/// @param octave Octave offset from the content line (0 = octave 4).
/// @param key_sig Declared key (C major when no key directive is present).
/// @return Spelled pitch.
SpelledPitch spellDegree(Degree degree, int octave, const KeySignature& key_sig);

/// @brief MIDI-style absolute semitone (C4 = 60) of a spelled pitch.
int spelledPitchSemitone(const SpelledPitch& pitch);

/// @brief Uppercase letter of a spelled pitch ('C' .. 'B').
char spelledPitchLetter(const SpelledPitch& pitch);

/// @brief Accidental text ("", "#", "##", "b", "bb").
std::string alterationToString(int alteration);

}  // namespace mtext

#endif  // MTEXT_HARMONY_PITCH_SPELLING_H
