/// @file
/// @brief Top-level parse and render dispatch.

#include "music_text.h"

#include "parse/document_parser.h"
#include "render/document_json_renderer.h"
#include "render/editor_span_renderer.h"
#include "render/lilypond_renderer.h"
#include "render/score_json_renderer.h"

namespace mtext {

ParseResult parse(std::string_view text) {
  ParseResult result;
  result.success = parseDocument(text, result.document, result.warnings, result.error);
  if (!result.success) {
    result.error_message = result.error.toString();
  }
  return result;
}

std::string render(const Document& document, OutputFormat format, const RenderOptions& options) {
  switch (format) {
    case OutputFormat::Lilypond:
      return renderLilypond(document, options);
    case OutputFormat::ScoreJson:
      return renderScoreJson(document, options);
    case OutputFormat::EditorSpans:
      return renderEditorSpans(document, options);
    case OutputFormat::DocumentJson:
      return renderDocumentJson(document, options);
  }
  return renderLilypond(document, options);
}

}  // namespace mtext
