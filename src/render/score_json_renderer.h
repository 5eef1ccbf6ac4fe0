// 2-D score element JSON (VexFlow-style) projection.

#ifndef MTEXT_RENDER_SCORE_JSON_RENDERER_H
#define MTEXT_RENDER_SCORE_JSON_RENDERER_H

#include <string>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "harmony/key.h"
#include "harmony/pitch_spelling.h"
#include "parse/document_types.h"
#include "render/render_options.h"

namespace mtext {

/// @brief VexFlow key string "c#/4" for a spelled pitch.
std::string vexflowKey(const SpelledPitch& pitch);

/// @brief Accidental to draw under the key signature.
///
/// Empty when the pitch matches the signature; "n" when a natural cancels a
/// signature accidental; otherwise "#", "##", "b" or "bb".
std::string vexflowAccidental(const SpelledPitch& pitch, const KeyAlterations& signature);

/// @brief bar_type string: single, double, end, repeat-start, repeat-end, repeat-both.
const char* vexflowBarType(BarlineStyle style);

/// @brief Key signature name for VexFlow ("D", "Bb", "F#m").
std::string vexflowKeySignature(const KeySignature& key_sig);

/// @brief Beam flags for one beat.
///
/// beamable[i] is true for notes with a flag (8th or shorter). The longest
/// contiguous run of beamable notes (first one on ties) is beamed when it
/// holds at least two notes.
/// @return Pair of (first index, last index), or (-1, -1) if nothing is beamed.
std::pair<int, int> findBeamRun(const std::vector<bool>& beamable);

/// @brief Render a document to score JSON.
///
/// Shape: {"staves":[{"notes":[...],"key_signature":K}],"title":T,
/// "author":A,"time_signature":"4/4","clef":"treble","key_signature":K}.
std::string renderScoreJson(const Document& document, const RenderOptions& options);

}  // namespace mtext

#endif  // MTEXT_RENDER_SCORE_JSON_RENDERER_H
