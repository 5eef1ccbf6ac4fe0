// Per-stave notation system detection by weighted character vote.

#ifndef MTEXT_NOTATION_NOTATION_DETECTOR_H
#define MTEXT_NOTATION_NOTATION_DETECTOR_H

#include <cstdint>
#include <string_view>

#include "core/basic_types.h"

namespace mtext {

/// @brief Raw vote counts for one content line.
struct NotationVotes {
  uint32_t number = 0;
  uint32_t western = 0;
  uint32_t sargam = 0;
};

/// @brief Count votes per character.
///
/// Digits 1-7 vote Number. C E F A B vote Western. S s r m N n p vote
/// Sargam. G g D d R M P are ambiguous and vote for both Western and Sargam.
/// @param line Content line text.
/// @return Vote totals.
NotationVotes countNotationVotes(std::string_view line);

/// @brief Choose the notation system of a content line.
///
/// The maximum vote wins. On a tie Number wins if any digit is present,
/// otherwise Western.
/// @param line Content line text.
/// @return Detected system.
NotationSystem detectNotationSystem(std::string_view line);

}  // namespace mtext

#endif  // MTEXT_NOTATION_NOTATION_DETECTOR_H
