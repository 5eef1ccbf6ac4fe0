// Beat grouping, dash extension, tie inference and tuplet detection.

#ifndef MTEXT_RHYTHM_RHYTHM_FSM_H
#define MTEXT_RHYTHM_RHYTHM_FSM_H

#include <cstdint>
#include <optional>
#include <vector>

#include "core/degree.h"
#include "parse/document_types.h"
#include "parse/element_types.h"
#include "rhythm/rhythm_types.h"

namespace mtext {

/// @brief States of the rhythm machine.
enum class FsmState : uint8_t {
  S0,               ///< Between beats.
  CollectingPitch,  ///< Current beat started with a pitched element.
  CollectingRests,  ///< Current beat started with a dash that became a rest.
  Halt
};

/// @brief Convert FsmState to a string.
const char* fsmStateToString(FsmState state);

/// @brief Document-level inputs that shape the item stream.
struct RhythmContext {
  std::optional<Degree> tonic;  ///< Emits a leading Tonic item when set.
  std::optional<uint8_t> tala;  ///< Default tala for barlines without a marker.
};

/// @brief Largest power of two strictly below divisions, at least 2.
/// @param divisions Beat divisions (> 1).
/// @return Denominator of the tuplet ratio (3 -> 2, 5 -> 4, 9 -> 8).
uint32_t tupletPowerOfTwo(uint32_t divisions);

/// @brief Compute divisions, tuplet flags and per-element durations.
///
/// Tuplet beats (more than one element and divisions not a power of two):
///   duration = subdivisions / divisions,
///   tuplet_duration = tuplet_display_duration = subdivisions / (4 * power).
/// Other beats:
///   duration = tuplet_duration = subdivisions / (4 * divisions).
void finalizeBeat(Beat& beat);

/// @brief Run the rhythm machine over a spatially resolved content line.
///
/// Fills Note durations in place and gives dashes that start a tied beat the
/// degree and octave of the note they continue.
/// @param elements Content-line elements (after spatial assignment).
/// @param context Tonic and default tala.
/// @param items Receives the output alphabet.
/// @param error Filled on an invariant violation.
/// @return False if a finished beat violates the beat invariants.
bool runRhythmFsm(std::vector<ParsedElement>& elements, const RhythmContext& context,
                  std::vector<Item>& items, ParseError& error);

}  // namespace mtext

#endif  // MTEXT_RHYTHM_RHYTHM_FSM_H
