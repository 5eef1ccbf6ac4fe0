/// @file
/// @brief Document accessors.

#include "parse/document_types.h"

#include "core/text_utils.h"

namespace mtext {

std::string ParseError::toString() const {
  return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message;
}

const char* staveLineKindToString(StaveLineKind kind) {
  switch (kind) {
    case StaveLineKind::Text:    return "text";
    case StaveLineKind::Upper:   return "upper";
    case StaveLineKind::Content: return "content";
    case StaveLineKind::Lower:   return "lower";
    case StaveLineKind::Lyrics:  return "lyrics";
  }
  return "text";
}

const StaveLine* Stave::contentLine() const {
  for (const auto& line : lines) {
    if (line.kind == StaveLineKind::Content) return &line;
  }
  return nullptr;
}

StaveLine* Stave::contentLine() {
  for (auto& line : lines) {
    if (line.kind == StaveLineKind::Content) return &line;
  }
  return nullptr;
}

const std::string* Document::directive(std::string_view key) const {
  std::string wanted = toLower(key);
  for (const auto& entry : directives) {
    if (toLower(entry.first) == wanted) return &entry.second;
  }
  return nullptr;
}

void Document::setDirective(const std::string& key, const std::string& value) {
  std::string wanted = toLower(key);
  for (auto& entry : directives) {
    if (toLower(entry.first) == wanted) {
      entry.second = value;
      return;
    }
  }
  directives.emplace_back(key, value);
}

std::string Document::title() const {
  const std::string* value = directive("title");
  return value != nullptr ? *value : std::string();
}

std::string Document::author() const {
  const std::string* value = directive("author");
  if (value == nullptr) value = directive("composer");
  return value != nullptr ? *value : std::string();
}

std::vector<const Stave*> Document::staves() const {
  std::vector<const Stave*> result;
  for (const auto& element : elements) {
    if (element.kind == DocumentElementKind::Stave) result.push_back(&element.stave);
  }
  return result;
}

}  // namespace mtext
