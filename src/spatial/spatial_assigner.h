// Column-based assignment of upper/lower/lyrics annotations to content notes.

#ifndef MTEXT_SPATIAL_SPATIAL_ASSIGNER_H
#define MTEXT_SPATIAL_SPATIAL_ASSIGNER_H

#include <string>
#include <vector>

#include "parse/document_types.h"

namespace mtext {

/// @brief Attach every annotation of a stave to its content notes.
///
/// Markers move their text into children of the target note and are left
/// with value == std::nullopt and state Consumed (or Dropped with a warning).
///
/// Order of work:
///  1. Octave markers, nearest line first: exact column, then the nearest
///     note with octave 0 within kMaxAssignDistance columns (ties to the left).
///     Upper and lower markers add; a second marker from the same side loses.
///  2. Ornaments the same way; a digit 0-6 directly above a barline becomes
///     the barline's tala.
///  3. Slurs (upper "__") and beat groups (lower "__"): Start/Middle/End roles
///     over two or more notes. Beat groups fall back to the two nearest notes.
///  4. Syllables zipped onto notes; notes inside a slur after its Start get "_".
///  5. SlurStart/SlurEnd elements inserted around each slur.
///  6. Cross-check of note octaves and a check that no marker is left pending.
///
/// @param stave Stave with tokenized lines.
/// @param warnings Receives non-fatal diagnostics.
/// @param error Filled when a post-condition fails.
/// @return False on an invariant violation.
bool assignSpatial(Stave& stave, std::vector<std::string>& warnings, ParseError& error);

}  // namespace mtext

#endif  // MTEXT_SPATIAL_SPATIAL_ASSIGNER_H
