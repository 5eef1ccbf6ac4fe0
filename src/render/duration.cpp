/// @file
/// @brief Standard duration table and greedy tie decomposition.

#include "render/duration.h"

namespace mtext {

namespace {

constexpr uint32_t kStandardDenominators[] = {1, 2, 4, 8, 16, 32, 64};

}  // namespace

Fraction durationPartValue(const DurationPart& part) {
  Fraction base(1, part.denominator);
  switch (part.dots) {
    case 1:  return base * Fraction(3, 2);
    case 2:  return base * Fraction(7, 4);
    default: return base;
  }
}

bool standardDuration(const Fraction& duration, DurationPart& part) {
  for (uint8_t dots = 0; dots <= 2; ++dots) {
    for (uint32_t denominator : kStandardDenominators) {
      DurationPart candidate{denominator, dots};
      // 1/64 cannot carry dots.
      if (dots > 0 && denominator == 64) continue;
      if (dots == 2 && denominator == 32) continue;
      if (durationPartValue(candidate) == duration) {
        part = candidate;
        return true;
      }
    }
  }
  return false;
}

std::vector<DurationPart> decomposeDuration(const Fraction& duration) {
  std::vector<DurationPart> parts;
  if (!duration.isPositive()) return parts;

  DurationPart single;
  if (standardDuration(duration, single)) {
    parts.push_back(single);
    return parts;
  }

  // Round up to a whole number of 1/64 notes so short values keep a part.
  int64_t sixty_fourths = (duration.num() * 64 + duration.den() - 1) / duration.den();
  Fraction remainder(sixty_fourths, 64);
  if (standardDuration(remainder, single)) {
    parts.push_back(single);
    return parts;
  }
  for (uint32_t denominator : kStandardDenominators) {
    Fraction value(1, denominator);
    while (value <= remainder) {
      parts.push_back(DurationPart{denominator, 0});
      remainder = remainder - value;
    }
  }
  return parts;
}

std::string lilypondDurationString(const DurationPart& part) {
  std::string result = std::to_string(part.denominator);
  result.append(part.dots, '.');
  return result;
}

std::string vexflowDurationCode(const DurationPart& part) {
  switch (part.denominator) {
    case 1: return "w";
    case 2: return "h";
    case 4: return "q";
    default: return std::to_string(part.denominator);
  }
}

}  // namespace mtext
