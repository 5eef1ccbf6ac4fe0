/// @file
/// @brief Document dump for the --document CLI flag.

#include "render/document_json_renderer.h"

#include "core/json_helpers.h"

namespace mtext {

namespace {

void writePosition(JsonWriter& writer, const Position& position) {
  writer.key("position");
  writer.beginObject();
  writer.field("row", position.row);
  writer.field("col", position.col);
  writer.field("char_index", position.char_index);
  writer.endObject();
}

void writeChildren(JsonWriter& writer, const std::vector<ParsedChild>& children) {
  writer.key("children");
  writer.beginArray();
  for (const auto& child : children) {
    writer.beginObject();
    writer.field("kind", childKindToString(child.kind));
    writer.field("text", child.text);
    writer.field("distance", static_cast<int>(child.distance));
    switch (child.kind) {
      case ChildKind::OctaveMarker:
        writer.field("octave", static_cast<int>(child.octave_value));
        break;
      case ChildKind::Ornament:
        writer.field("ornament", ornamentTypeToString(child.ornament));
        break;
      case ChildKind::BeatGroupIndicator:
        writer.field("span", child.span);
        break;
      case ChildKind::Syllable:
        break;
    }
    writer.endObject();
  }
  writer.endArray();
}

void writeElement(JsonWriter& writer, const ParsedElement& element) {
  writer.beginObject();
  writer.field("kind", elementKindToString(element.kind));
  writer.field("value", element.value);
  writePosition(writer, element.position);
  if (element.degree.has_value()) {
    writer.field("degree", degreeToString(*element.degree));
    writer.field("octave", static_cast<int>(element.octave));
  }
  if (element.duration.has_value()) {
    writer.field("duration", *element.duration);
  }
  if (element.slur.has_value()) {
    writer.field("slur", roleToString(*element.slur));
  }
  if (element.beat_group.has_value()) {
    writer.field("beat_group", roleToString(*element.beat_group));
  }
  if (element.kind == ElementKind::Barline) {
    writer.field("style", barlineStyleToString(element.barline_style));
    if (element.tala.has_value()) {
      writer.field("tala", static_cast<int>(*element.tala));
    }
  }
  if (!element.children.empty()) writeChildren(writer, element.children);
  writer.endObject();
}

void writeAnnotation(JsonWriter& writer, const AnnotationElement& annotation) {
  writer.beginObject();
  writer.field("kind", annotationKindToString(annotation.kind));
  writer.key("value");
  if (annotation.value.has_value()) {
    writer.value(*annotation.value);
  } else {
    writer.valueNull();
  }
  writePosition(writer, annotation.position);
  writer.field("length", annotation.text_length);
  if (annotation.isMarker()) {
    writer.field("consumed", annotation.state == MarkerState::Consumed);
  }
  writer.endObject();
}

void writeBeat(JsonWriter& writer, const Beat& beat) {
  writer.field("divisions", beat.divisions);
  writer.field("tied_to_previous", beat.tied_to_previous);
  writer.field("is_tuplet", beat.is_tuplet);
  if (beat.tuplet_ratio.has_value()) {
    writer.key("tuplet_ratio");
    writer.beginArray();
    writer.value(beat.tuplet_ratio->first);
    writer.value(beat.tuplet_ratio->second);
    writer.endArray();
  }
  writer.key("elements");
  writer.beginArray();
  for (const auto& element : beat.elements) {
    writer.beginObject();
    writer.field("event", eventKindToString(element.event));
    writer.field("value", element.value);
    if (element.degree.has_value()) {
      writer.field("degree", degreeToString(*element.degree));
      writer.field("octave", static_cast<int>(element.octave));
    }
    writer.field("subdivisions", element.subdivisions);
    writer.field("duration", element.duration);
    writer.field("tuplet_duration", element.tuplet_duration);
    if (element.tied_to_previous) {
      writer.field("tied_to_previous", true);
    }
    writePosition(writer, element.position);
    writer.endObject();
  }
  writer.endArray();
}

void writeItems(JsonWriter& writer, const std::vector<Item>& items) {
  writer.key("rhythm_items");
  writer.beginArray();
  for (const auto& item : items) {
    writer.beginObject();
    writer.field("kind", itemKindToString(item.kind));
    switch (item.kind) {
      case ItemKind::Beat:
        writeBeat(writer, item.beat);
        break;
      case ItemKind::Barline:
        writer.field("style", barlineStyleToString(item.barline_style));
        if (item.tala.has_value()) {
          writer.field("tala", static_cast<int>(*item.tala));
        }
        break;
      case ItemKind::Tonic:
        writer.field("degree", degreeToString(item.tonic));
        break;
      case ItemKind::Breathmark:
        break;
    }
    writer.endObject();
  }
  writer.endArray();
}

void writeStave(JsonWriter& writer, const Stave& stave) {
  writer.field("notation_system", notationSystemToString(stave.notation_system));
  writer.field("begin_multi_stave", stave.begin_multi_stave);
  writer.field("end_multi_stave", stave.end_multi_stave);
  writer.key("lines");
  writer.beginArray();
  for (const auto& line : stave.lines) {
    writer.beginObject();
    writer.field("kind", staveLineKindToString(line.kind));
    writer.field("row", line.row);
    writer.field("text", line.text);
    if (line.kind == StaveLineKind::Content) {
      writer.key("elements");
      writer.beginArray();
      for (const auto& element : line.elements) writeElement(writer, element);
      writer.endArray();
    } else if (!line.annotations.empty()) {
      writer.key("annotations");
      writer.beginArray();
      for (const auto& annotation : line.annotations) writeAnnotation(writer, annotation);
      writer.endArray();
    }
    writer.endObject();
  }
  writer.endArray();
  if (stave.rhythm_items.has_value()) writeItems(writer, *stave.rhythm_items);
}

}  // namespace

std::string renderDocumentJson(const Document& document, const RenderOptions& options) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("directives");
  writer.beginObject();
  for (const auto& entry : document.directives) {
    writer.field(entry.first, entry.second);
  }
  writer.endObject();

  writer.key("elements");
  writer.beginArray();
  for (const auto& element : document.elements) {
    writer.beginObject();
    if (element.kind == DocumentElementKind::BlankLines) {
      writer.field("kind", "blank_lines");
      writer.field("count", element.blank_line_count);
    } else {
      writer.field("kind", "stave");
      writeStave(writer, element.stave);
    }
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return options.pretty_json ? writer.toPrettyString() : writer.toString();
}

}  // namespace mtext
