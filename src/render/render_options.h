// Rendering configuration shared by every back-end.

#ifndef MTEXT_RENDER_RENDER_OPTIONS_H
#define MTEXT_RENDER_RENDER_OPTIONS_H

#include <cstdint>
#include <string>

namespace mtext {

/// @brief Output format selector.
enum class OutputFormat : uint8_t {
  Lilypond,     ///< Engraver source.
  ScoreJson,    ///< 2-D score element JSON.
  EditorSpans,  ///< Editor spans and styles.
  DocumentJson  ///< Resolved document dump.
};

/// @brief Convert OutputFormat to its CLI / C API name.
const char* outputFormatToString(OutputFormat format);

/// @brief Parse "lilypond", "json", "spans" or "document".
/// @return False on an unknown name.
bool outputFormatFromString(const std::string& str, OutputFormat& format);

/// @brief Options for the render functions.
struct RenderOptions {
  bool include_header = true;   ///< LilyPond \header block.
  bool include_lyrics = true;   ///< LilyPond \addlyrics and JSON syllables.
  bool pretty_json = false;     ///< Indented JSON output.
  std::string lilypond_version = "2.24.0";
};

}  // namespace mtext

#endif  // MTEXT_RENDER_RENDER_OPTIONS_H
