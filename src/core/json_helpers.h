// JSON string builder shared by the JSON back-ends and the C API.
//
// Output is compact; toPrettyString() re-indents it for --pretty. There is no
// reader here, flat option objects are parsed by core/json_parser.h.

#ifndef MTEXT_CORE_JSON_HELPERS_H
#define MTEXT_CORE_JSON_HELPERS_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/fraction.h"

namespace mtext {

/// @brief Incremental JSON writer.
///
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("keys");
///   writer.beginArray();
///   writer.value("c/4");
///   writer.endArray();
///   writer.field("duration", Fraction(1, 4));
///   writer.endObject();
///   // {"keys":["c/4"],"duration":"1/4"}
/// @endcode
///
/// Commas are inserted automatically. Begin/end pairs are not checked.
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call writes its value.
  void key(std::string_view name);

  /// @brief Write a JSON-escaped string.
  void value(std::string_view val);

  /// @brief String literal overload; would otherwise bind to value(bool).
  void value(const char* val);

  void value(int val);
  void value(uint32_t val);
  void value(bool val);

  /// @brief Write a duration as its "num/den" string.
  void value(const Fraction& val);

  void valueNull();

  /// @brief Shorthand for key(name) followed by value(val).
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief Compact JSON written so far.
  const std::string& toString() const { return buffer_; }

  /// @brief Indented copy of toString() (": " after keys, {} and [] kept inline).
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Append one scalar token after any pending comma.
  void emit(std::string_view token);

  void open(char bracket);
  void close(char bracket);

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once it holds an element.
  std::vector<bool> has_items_;
  bool after_key_ = false;
};

/// @brief Re-indent compact JSON text.
/// @param compact JSON without insignificant whitespace.
/// @param indent_size Spaces per nesting level.
std::string prettyPrintJson(std::string_view compact, int indent_size);

}  // namespace mtext

#endif  // MTEXT_CORE_JSON_HELPERS_H
