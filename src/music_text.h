// Top-level entry points: parse text into a Document and render it.

#ifndef MTEXT_MUSIC_TEXT_H
#define MTEXT_MUSIC_TEXT_H

#include <string>
#include <string_view>
#include <vector>

#include "parse/document_types.h"
#include "render/render_options.h"

namespace mtext {

/// @brief Result of parse().
///
/// On failure document holds every stave completed before the error and
/// error_message is error.toString().
struct ParseResult {
  bool success = false;
  Document document;
  std::vector<std::string> warnings;
  ParseError error;
  std::string error_message;
};

/// @brief Parse plain-text notation into a resolved Document.
/// @param text UTF-8 input; takes no other configuration.
/// @return ParseResult with warnings in pipeline order.
ParseResult parse(std::string_view text);

/// @brief Render a parsed document with one back-end.
/// @param document Result of parse().
/// @param format Back-end to use.
/// @param options Header, lyrics and JSON formatting switches.
/// @return Engraver source or JSON text.
std::string render(const Document& document, OutputFormat format, const RenderOptions& options);

}  // namespace mtext

#endif  // MTEXT_MUSIC_TEXT_H
