// Document model: directives, staves, stave lines and parse errors.

#ifndef MTEXT_PARSE_DOCUMENT_TYPES_H
#define MTEXT_PARSE_DOCUMENT_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/basic_types.h"
#include "parse/element_types.h"
#include "rhythm/rhythm_types.h"

namespace mtext {

/// @brief Structural error with a 1-based source location.
struct ParseError {
  uint32_t line = 0;
  uint32_t column = 0;
  std::string message;

  /// @brief Format as "line L, column C: message".
  std::string toString() const;
};

// ---------------------------------------------------------------------------
// Stave lines
// ---------------------------------------------------------------------------

/// @brief Role of one line inside a stave.
enum class StaveLineKind : uint8_t {
  Text,
  Upper,
  Content,
  Lower,
  Lyrics
};

/// @brief Convert StaveLineKind to a lowercase string.
const char* staveLineKindToString(StaveLineKind kind);

/// @brief One source line of a stave with its tokens.
///
/// Content lines fill elements. Upper, lower and lyrics lines fill
/// annotations. Text lines keep only text.
struct StaveLine {
  StaveLineKind kind = StaveLineKind::Text;
  std::string text;
  uint32_t row = 0;
  uint32_t char_offset = 0;  ///< char_index of column 0.
  std::vector<ParsedElement> elements;
  std::vector<AnnotationElement> annotations;
};

/// @brief One content line plus its surrounding annotation lines.
struct Stave {
  std::vector<StaveLine> lines;
  std::optional<std::vector<Item>> rhythm_items;
  NotationSystem notation_system = NotationSystem::Number;
  std::string source;
  uint32_t start_row = 0;
  bool begin_multi_stave = false;
  bool end_multi_stave = false;

  /// @brief The content line, or nullptr if the stave has none.
  const StaveLine* contentLine() const;
  StaveLine* contentLine();
};

// ---------------------------------------------------------------------------
// Document
// ---------------------------------------------------------------------------

/// @brief Tag of a top-level document element.
enum class DocumentElementKind : uint8_t {
  BlankLines,
  Stave
};

/// @brief Either a run of blank lines or a stave.
struct DocumentElement {
  DocumentElementKind kind = DocumentElementKind::Stave;
  uint32_t blank_line_count = 0;  ///< BlankLines only.
  Stave stave;                    ///< Stave only.
};

/// @brief Fully resolved parse output.
struct Document {
  /// Directives in insertion order; keys keep their source case.
  std::vector<std::pair<std::string, std::string>> directives;
  std::vector<DocumentElement> elements;
  std::string source;

  /// @brief Case-insensitive directive lookup.
  /// @return Pointer to the value, or nullptr if absent.
  const std::string* directive(std::string_view key) const;

  /// @brief Insert or overwrite (in place) a directive.
  void setDirective(const std::string& key, const std::string& value);

  /// @brief Title directive or empty string.
  std::string title() const;

  /// @brief Author (or composer) directive or empty string.
  std::string author() const;

  /// @brief All staves in document order.
  std::vector<const Stave*> staves() const;
};

}  // namespace mtext

#endif  // MTEXT_PARSE_DOCUMENT_TYPES_H
