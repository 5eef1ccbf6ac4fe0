/// @file
/// @brief Span and style generation for editor highlighting.

#include "render/editor_span_renderer.h"

#include "core/json_helpers.h"
#include "core/text_utils.h"

namespace mtext {

namespace {

const char* roleSuffix(Role role) {
  switch (role) {
    case Role::Start:  return "start";
    case Role::Middle: return "middle";
    case Role::End:    return "end";
  }
  return "middle";
}

std::string glyphRange(const std::vector<std::string>& glyphs, uint32_t col, uint32_t length) {
  std::string result;
  for (uint32_t idx = col; idx < col + length && idx < glyphs.size(); ++idx) {
    result += glyphs[idx];
  }
  return result;
}

class SpanBuilder {
 public:
  explicit SpanBuilder(EditorSpans& out) : out_(out) {}

  void addStave(const Stave& stave) {
    content_tokens_.clear();
    for (const auto& line : stave.lines) {
      switch (line.kind) {
        case StaveLineKind::Content:
          addContentLine(line);
          break;
        case StaveLineKind::Upper:
        case StaveLineKind::Lower:
        case StaveLineKind::Lyrics:
          addAnnotationLine(line);
          break;
        case StaveLineKind::Text:
          addTextLine(line);
          break;
      }
    }
    if (stave.rhythm_items.has_value()) {
      for (const auto& item : *stave.rhythm_items) {
        if (item.kind == ItemKind::Beat) markBeat(item.beat);
      }
    }
  }

 private:
  struct ContentToken {
    uint32_t row;
    uint32_t col;
    size_t style;
  };

  size_t add(const std::string& type, uint32_t start, const std::string& content) {
    EditorSpan span;
    span.type = type;
    span.start = start;
    span.end = start + static_cast<uint32_t>(glyphCount(content));
    span.content = content;

    EditorStyle style;
    style.pos = span.start;
    style.length = span.end - span.start;
    style.classes.push_back("cm-" + type);

    out_.spans.push_back(span);
    out_.styles.push_back(style);
    return out_.styles.size() - 1;
  }

  void addTextLine(const StaveLine& line) {
    if (isBlank(line.text)) return;
    add("text", line.char_offset, line.text);
  }

  void addContentLine(const StaveLine& line) {
    for (const auto& element : line.elements) {
      if (element.kind == ElementKind::Whitespace || element.kind == ElementKind::Newline ||
          element.isSynthetic()) {
        continue;
      }
      size_t index = add(elementKindToString(element.kind), element.position.char_index,
                         element.value);
      std::vector<std::string>& classes = out_.styles[index].classes;

      if (element.octave > 0) {
        classes.push_back("octave-" + std::to_string(element.octave));
      } else if (element.octave < 0) {
        classes.push_back("octave-neg-" + std::to_string(-element.octave));
      }
      if (element.kind == ElementKind::Dash && element.degree.has_value()) {
        classes.push_back("tied");
      }
      if (element.in_slur) classes.push_back("in-slur");
      if (element.slur.has_value()) {
        classes.push_back(std::string("slur-") + roleSuffix(*element.slur));
      }
      if (element.in_beat_group) classes.push_back("in-beat-group");
      if (element.beat_group.has_value()) {
        classes.push_back(std::string("beat-group-") + roleSuffix(*element.beat_group));
      }
      content_tokens_.push_back({element.position.row, element.position.col, index});
    }
  }

  void addAnnotationLine(const StaveLine& line) {
    std::vector<std::string> glyphs = splitGlyphs(line.text);
    for (const auto& annotation : line.annotations) {
      if (annotation.kind == AnnotationKind::Space) continue;
      std::string content = glyphRange(glyphs, annotation.position.col, annotation.text_length);
      size_t index = add(annotationKindToString(annotation.kind),
                         annotation.position.char_index, content);
      if (annotation.state == MarkerState::Consumed) {
        out_.styles[index].classes.push_back("consumed");
      } else if (annotation.state == MarkerState::Dropped) {
        out_.styles[index].classes.push_back("dropped");
      }
    }
  }

  void markBeat(const Beat& beat) {
    if (beat.divisions <= 1) return;
    std::vector<size_t> tokens;
    for (const auto& token : content_tokens_) {
      if (token.row == beat.row && token.col >= beat.start_col && token.col < beat.end_col) {
        tokens.push_back(token.style);
      }
    }
    if (tokens.empty()) return;

    std::string divisions = std::to_string(beat.divisions);
    EditorStyle& first = out_.styles[tokens.front()];
    first.classes.push_back("beat-loop-" + divisions);
    first.styles.emplace_back("--show-divisions", divisions);

    int label = tupletLabelIndex(beat.divisions, tokens.size());
    if (label >= 0) {
      out_.styles[tokens[static_cast<size_t>(label)]].styles.emplace_back(
          "--tuplet", "'" + divisions + "'");
    }
  }

  EditorSpans& out_;
  std::vector<ContentToken> content_tokens_;
};

}  // namespace

int tupletLabelIndex(uint32_t divisions, size_t token_count) {
  if (token_count == 0) return -1;
  bool odd = divisions % 2 == 1;
  if (!((odd && divisions >= 3) || divisions > 9)) return -1;
  // Middle token: (N+1)/2 for odd N, N/2 for even N (1-based).
  size_t middle = odd ? (divisions + 1) / 2 : divisions / 2;
  size_t index = middle - 1;
  if (index >= token_count) index = token_count - 1;
  return static_cast<int>(index);
}

EditorSpans buildEditorSpans(const Document& document) {
  EditorSpans result;
  SpanBuilder builder(result);
  for (const Stave* stave : document.staves()) builder.addStave(*stave);
  return result;
}

std::string renderEditorSpans(const Document& document, const RenderOptions& options) {
  EditorSpans spans = buildEditorSpans(document);

  JsonWriter writer;
  writer.beginObject();
  writer.key("spans");
  writer.beginArray();
  for (const auto& span : spans.spans) {
    writer.beginObject();
    writer.field("type", span.type);
    writer.field("start", span.start);
    writer.field("end", span.end);
    writer.field("content", span.content);
    writer.endObject();
  }
  writer.endArray();

  writer.key("styles");
  writer.beginArray();
  for (const auto& style : spans.styles) {
    writer.beginObject();
    writer.field("pos", style.pos);
    writer.field("length", style.length);
    writer.key("classes");
    writer.beginArray();
    for (const auto& name : style.classes) writer.value(name);
    writer.endArray();
    writer.key("styles");
    writer.beginObject();
    for (const auto& entry : style.styles) {
      writer.field(entry.first, entry.second);
    }
    writer.endObject();
    writer.endObject();
  }
  writer.endArray();
  writer.endObject();
  return options.pretty_json ? writer.toPrettyString() : writer.toString();
}

}  // namespace mtext
