// Scale degree with accidental, independent of octave and tonic.

#ifndef MTEXT_CORE_DEGREE_H
#define MTEXT_CORE_DEGREE_H

#include <cstdint>
#include <string>

namespace mtext {

/// @brief Seven scale degrees times five accidentals (bb, b, natural, #, ##).
///
/// Values are ordered step-major: index = step * 5 + (alteration + 2).
enum class Degree : uint8_t {
  N1bb, N1b, N1, N1s, N1ss,
  N2bb, N2b, N2, N2s, N2ss,
  N3bb, N3b, N3, N3s, N3ss,
  N4bb, N4b, N4, N4s, N4ss,
  N5bb, N5b, N5, N5s, N5ss,
  N6bb, N6b, N6, N6s, N6ss,
  N7bb, N7b, N7, N7s, N7ss
};

constexpr int kDegreeCount = 35;

/// Semitones of the major scale steps above the tonic.
constexpr int kMajorScaleSemitones[7] = {0, 2, 4, 5, 7, 9, 11};

/// @brief Zero-based scale step (0 = degree 1, 6 = degree 7).
int degreeStep(Degree degree);

/// @brief Chromatic alteration in semitones (-2..2).
int degreeAlteration(Degree degree);

/// @brief Build a Degree from step and alteration.
/// @param step Zero-based step, wrapped into 0..6.
/// @param alteration Clamped into -2..2.
Degree makeDegree(int step, int alteration);

/// @brief Semitones above the tonic (may fall outside 0..11 for altered degrees).
int degreeSemitone(Degree degree);

/// @brief Canonical number spelling: "1", "3b", "4#", "7bb".
std::string degreeToString(Degree degree);

}  // namespace mtext

#endif  // MTEXT_CORE_DEGREE_H
