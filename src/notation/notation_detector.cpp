/// @file
/// @brief Notation system vote counting.

#include "notation/notation_detector.h"

namespace mtext {

NotationVotes countNotationVotes(std::string_view line) {
  NotationVotes votes;
  for (char chr : line) {
    switch (chr) {
      case '1': case '2': case '3': case '4': case '5': case '6': case '7':
        ++votes.number;
        break;
      case 'C': case 'E': case 'F': case 'A': case 'B':
        ++votes.western;
        break;
      case 'S': case 's': case 'r': case 'm': case 'N': case 'n': case 'p':
        ++votes.sargam;
        break;
      case 'G': case 'g': case 'D': case 'd': case 'R': case 'M': case 'P':
        ++votes.western;
        ++votes.sargam;
        break;
      default:
        break;
    }
  }
  return votes;
}

NotationSystem detectNotationSystem(std::string_view line) {
  NotationVotes votes = countNotationVotes(line);
  bool has_digit = votes.number > 0;

  uint32_t best = votes.number;
  if (votes.western > best) best = votes.western;
  if (votes.sargam > best) best = votes.sargam;

  if (has_digit && votes.number == best) return NotationSystem::Number;
  if (votes.western == best) return NotationSystem::Western;
  if (votes.sargam == best) return NotationSystem::Sargam;
  return NotationSystem::Western;
}

}  // namespace mtext
