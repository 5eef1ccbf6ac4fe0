// Flat JSON object reader for C API render options.
//
// Accepts one object whose values are strings, numbers, booleans or null.
// Nested objects and arrays are validated and skipped.

#ifndef MTEXT_CORE_JSON_PARSER_H
#define MTEXT_CORE_JSON_PARSER_H

#include <map>
#include <string>
#include <string_view>

namespace mtext {

/// @brief A scalar JSON value.
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  int asInt(int default_val = 0) const;
  bool asBool(bool default_val = false) const;
  std::string asString(const std::string& default_val = "") const;
};

using JsonObject = std::map<std::string, JsonValue>;

/// @brief Read a flat JSON object.
/// @param json Object text, surrounding whitespace allowed.
/// @param out Receives every scalar member; a repeated key keeps the last value.
/// @param error Set to "<problem> at offset N" on failure.
/// @return False if json is not a single well-formed object.
bool parseJsonObject(std::string_view json, JsonObject& out, std::string& error);

}  // namespace mtext

#endif  // MTEXT_CORE_JSON_PARSER_H
