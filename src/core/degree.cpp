/// @file
/// @brief Degree arithmetic helpers.

#include "core/degree.h"

namespace mtext {

int degreeStep(Degree degree) {
  return static_cast<int>(degree) / 5;
}

int degreeAlteration(Degree degree) {
  return static_cast<int>(degree) % 5 - 2;
}

Degree makeDegree(int step, int alteration) {
  step = ((step % 7) + 7) % 7;
  if (alteration < -2) alteration = -2;
  if (alteration > 2) alteration = 2;
  return static_cast<Degree>(step * 5 + alteration + 2);
}

int degreeSemitone(Degree degree) {
  return kMajorScaleSemitones[degreeStep(degree)] + degreeAlteration(degree);
}

std::string degreeToString(Degree degree) {
  std::string result = std::to_string(degreeStep(degree) + 1);
  switch (degreeAlteration(degree)) {
    case -2: result += "bb"; break;
    case -1: result += "b"; break;
    case 1:  result += "#"; break;
    case 2:  result += "##"; break;
    default: break;
  }
  return result;
}

}  // namespace mtext
