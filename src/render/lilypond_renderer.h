// LilyPond engraver source projection.

#ifndef MTEXT_RENDER_LILYPOND_RENDERER_H
#define MTEXT_RENDER_LILYPOND_RENDERER_H

#include <string>

#include "core/basic_types.h"
#include "harmony/key.h"
#include "harmony/pitch_spelling.h"
#include "parse/document_types.h"
#include "render/render_options.h"

namespace mtext {

/// @brief LilyPond note name relative to \fixed c' ("c", "fis'", "bes,").
std::string lilypondPitch(const SpelledPitch& pitch);

/// @brief "\key d \major" style key command.
std::string lilypondKey(const KeySignature& key_sig);

/// @brief Barline command: "|", "\bar \"||\"", "\bar \":|.\"", ...
std::string lilypondBarline(BarlineStyle style);

/// @brief Lyric token for a syllable: "ta", "he --", "_".
std::string lilypondLyric(const std::string& syllable);

/// @brief Music expression for one stave (without lyrics).
/// @param stave Resolved stave.
/// @param key_sig Key used for spelling and the \key command.
/// @param lyrics Receives the space-joined lyric tokens, empty if the stave
///        has no syllables.
/// @return "\fixed c' { ... }" block.
std::string renderLilypondStave(const Stave& stave, const KeySignature& key_sig,
                                std::string& lyrics);

/// @brief Render a document to LilyPond source.
///
/// Staves between a begin and an end multi-stave marker render as one
/// simultaneous group; all others render one after another.
std::string renderLilypond(const Document& document, const RenderOptions& options);

}  // namespace mtext

#endif  // MTEXT_RENDER_LILYPOND_RENDERER_H
