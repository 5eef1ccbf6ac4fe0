// Decomposition of fractional durations into standard note values.

#ifndef MTEXT_RENDER_DURATION_H
#define MTEXT_RENDER_DURATION_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/fraction.h"

namespace mtext {

/// @brief One written note value: 1/denominator with 0-2 dots.
struct DurationPart {
  uint32_t denominator = 4;  ///< 1, 2, 4, 8, 16, 32 or 64.
  uint8_t dots = 0;

  bool operator==(const DurationPart& other) const {
    return denominator == other.denominator && dots == other.dots;
  }
};

/// @brief Match a standard, dotted or double-dotted value exactly.
/// @param duration Fraction of a whole note.
/// @param part Receives the match.
/// @return False if the duration needs a tied chain.
bool standardDuration(const Fraction& duration, DurationPart& part);

/// @brief Written values for a duration.
///
/// Standard and dotted forms give one part. Anything else is rounded up to
/// a multiple of 1/64 and gives a greedy chain of undotted values (largest
/// first) meant to be tied, so a positive duration never yields an empty
/// list.
std::vector<DurationPart> decomposeDuration(const Fraction& duration);

/// @brief Sounding length of a part.
Fraction durationPartValue(const DurationPart& part);

/// @brief LilyPond duration: "4", "8.", "2..".
std::string lilypondDurationString(const DurationPart& part);

/// @brief VexFlow duration code without dots: "w", "h", "q", "8", "16", "32", "64".
std::string vexflowDurationCode(const DurationPart& part);

}  // namespace mtext

#endif  // MTEXT_RENDER_DURATION_H
