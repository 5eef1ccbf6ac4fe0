/// @file
/// @brief Output format names.

#include "render/render_options.h"

#include "core/text_utils.h"

namespace mtext {

const char* outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::Lilypond:     return "lilypond";
    case OutputFormat::ScoreJson:    return "json";
    case OutputFormat::EditorSpans:  return "spans";
    case OutputFormat::DocumentJson: return "document";
  }
  return "lilypond";
}

bool outputFormatFromString(const std::string& str, OutputFormat& format) {
  std::string lower = toLower(str);
  if (lower == "lilypond" || lower == "ly") {
    format = OutputFormat::Lilypond;
  } else if (lower == "json" || lower == "vexflow") {
    format = OutputFormat::ScoreJson;
  } else if (lower == "spans" || lower == "editor") {
    format = OutputFormat::EditorSpans;
  } else if (lower == "document") {
    format = OutputFormat::DocumentJson;
  } else {
    return false;
  }
  return true;
}

}  // namespace mtext
