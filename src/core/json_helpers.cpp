/// @file
/// @brief JsonWriter and the pretty-printer used for --pretty output.

#include "core/json_helpers.h"

#include <cstdio>

namespace mtext {

void JsonWriter::open(char bracket) {
  emit(std::string_view(&bracket, 1));
  has_items_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!has_items_.empty()) has_items_.pop_back();
  after_key_ = false;
}

void JsonWriter::emit(std::string_view token) {
  if (!after_key_ && !has_items_.empty()) {
    if (has_items_.back()) buffer_ += ',';
    has_items_.back() = true;
  }
  after_key_ = false;
  buffer_ += token;
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  emit("\"" + escapeString(name) + "\":");
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  emit("\"" + escapeString(val) + "\"");
}

void JsonWriter::value(const char* val) {
  value(std::string_view(val != nullptr ? val : ""));
}

void JsonWriter::value(int val) { emit(std::to_string(val)); }

void JsonWriter::value(uint32_t val) { emit(std::to_string(val)); }

void JsonWriter::value(bool val) { emit(val ? "true" : "false"); }

void JsonWriter::value(const Fraction& val) { value(val.toString()); }

void JsonWriter::valueNull() { emit("null"); }

std::string JsonWriter::toPrettyString(int indent_size) const {
  return prettyPrintJson(buffer_, indent_size);
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());
  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\b': result += "\\b";  break;
      case '\f': result += "\\f";  break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          // UTF-8 continuation bytes pass through unchanged.
          result += chr;
        }
        break;
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// Pretty-printer
// ---------------------------------------------------------------------------

std::string prettyPrintJson(std::string_view compact, int indent_size) {
  std::string out;
  out.reserve(compact.size() * 2);
  int depth = 0;
  bool in_string = false;

  auto newline = [&]() {
    out += '\n';
    out.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < compact.size(); ++pos) {
    char chr = compact[pos];
    if (in_string) {
      out += chr;
      if (chr == '\\' && pos + 1 < compact.size()) {
        out += compact[++pos];
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        out += chr;
        break;
      case '{':
      case '[': {
        out += chr;
        char next = pos + 1 < compact.size() ? compact[pos + 1] : '\0';
        if (next == '}' || next == ']') {
          out += next;
          ++pos;
        } else {
          ++depth;
          newline();
        }
        break;
      }
      case '}':
      case ']':
        --depth;
        newline();
        out += chr;
        break;
      case ',':
        out += chr;
        newline();
        break;
      case ':':
        out += ": ";
        break;
      default:
        out += chr;
        break;
    }
  }
  return out;
}

}  // namespace mtext
