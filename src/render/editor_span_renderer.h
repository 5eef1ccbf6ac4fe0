// Editor syntax spans and CSS class annotations (CodeMirror-style).

#ifndef MTEXT_RENDER_EDITOR_SPAN_RENDERER_H
#define MTEXT_RENDER_EDITOR_SPAN_RENDERER_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "parse/document_types.h"
#include "render/render_options.h"

namespace mtext {

/// @brief One highlighted token in source coordinates.
struct EditorSpan {
  std::string type;   ///< Kebab-case token kind ("note", "octave-marker", ...).
  uint32_t start = 0;  ///< char_index of the first glyph.
  uint32_t end = 0;    ///< One past the last glyph.
  std::string content;
};

/// @brief Classes and CSS variables for the span at the same index.
struct EditorStyle {
  uint32_t pos = 0;
  uint32_t length = 0;
  std::vector<std::string> classes;
  std::vector<std::pair<std::string, std::string>> styles;
};

/// @brief Parallel span and style streams.
struct EditorSpans {
  std::vector<EditorSpan> spans;
  std::vector<EditorStyle> styles;
};

/// @brief Build spans for every stave line of the document.
///
/// Whitespace and SlurStart/SlurEnd are skipped. The first token of a beat
/// with N > 1 divisions gets "beat-loop-N" and "--show-divisions: N"; the
/// middle token gets "--tuplet: 'N'" when N is odd and at least 3, or N > 9.
EditorSpans buildEditorSpans(const Document& document);

/// @brief Index of the token that carries the tuplet label, or -1.
/// @param divisions Beat divisions.
/// @param token_count Tokens inside the beat.
int tupletLabelIndex(uint32_t divisions, size_t token_count);

/// @brief Serialize buildEditorSpans() as {"spans":[...],"styles":[...]}.
std::string renderEditorSpans(const Document& document, const RenderOptions& options);

}  // namespace mtext

#endif  // MTEXT_RENDER_EDITOR_SPAN_RENDERER_H
