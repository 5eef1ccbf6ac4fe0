/// @file
/// @brief Pitch spelling by fixed table with key-signature preference.

#include "harmony/pitch_spelling.h"

namespace mtext {

namespace {

struct TableEntry {
  uint8_t letter;
  int8_t alteration;
};

/// Fixed pitch-class spelling: C C# D Eb E F F# G Ab A Bb B.
constexpr TableEntry kPitchClassTable[12] = {
    {0, 0}, {0, 1}, {1, 0}, {2, -1}, {2, 0}, {3, 0},
    {3, 1}, {4, 0}, {5, -1}, {5, 0}, {6, -1}, {6, 0}};

int floorDiv(int value, int divisor) {
  int quotient = value / divisor;
  if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --quotient;
  return quotient;
}

int positiveMod(int value, int modulus) {
  return ((value % modulus) + modulus) % modulus;
}

}  // namespace

SpelledPitch spellDegree(Degree degree, int octave, const KeySignature& key_sig) {
  // Absolute semitone with C4 = 60.
  int absolute = (kBaseOctave + 1 + octave) * 12 + degreeSemitone(degree) + tonicSemitone(key_sig);
  int pitch_class = positiveMod(absolute, 12);

  int letter = kPitchClassTable[pitch_class].letter;
  int alteration = kPitchClassTable[pitch_class].alteration;

  KeyAlterations signature = keySignatureAlterations(key_sig);
  for (int candidate = 0; candidate < 7; ++candidate) {
    int sounded = kMajorScaleSemitones[candidate] + signature[candidate];
    if (signature[candidate] != 0 && positiveMod(sounded, 12) == pitch_class) {
      letter = candidate;
      alteration = signature[candidate];
      break;
    }
  }

  SpelledPitch result;
  result.letter = static_cast<uint8_t>(letter);
  result.alteration = static_cast<int8_t>(alteration);
  // B# belongs to the octave below its sounding C, Cb to the octave above its B.
  result.octave = floorDiv(absolute - (kMajorScaleSemitones[letter] + alteration), 12) - 1;
  return result;
}

int spelledPitchSemitone(const SpelledPitch& pitch) {
  return (pitch.octave + 1) * 12 + kMajorScaleSemitones[pitch.letter] + pitch.alteration;
}

char spelledPitchLetter(const SpelledPitch& pitch) {
  return "CDEFGAB"[pitch.letter % 7];
}

std::string alterationToString(int alteration) {
  switch (alteration) {
    case -2: return "bb";
    case -1: return "b";
    case 1:  return "#";
    case 2:  return "##";
    default: return "";
  }
}

}  // namespace mtext
