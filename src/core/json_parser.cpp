/// @file
/// @brief Cursor-based reader for flat JSON option objects.

#include "core/json_parser.h"

#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace mtext {

int JsonValue::asInt(int default_val) const {
  return type == Number ? static_cast<int>(number_val) : default_val;
}

bool JsonValue::asBool(bool default_val) const {
  return type == Bool ? bool_val : default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  return type == String ? string_val : default_val;
}

namespace {

void appendUtf8(std::string& out, uint32_t code_point) {
  if (code_point < 0x80) {
    out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    out += static_cast<char>(0xC0 | (code_point >> 6));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    out += static_cast<char>(0xE0 | (code_point >> 12));
    out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

uint32_t hexDigitValue(char hex) {
  if (hex >= '0' && hex <= '9') return static_cast<uint32_t>(hex - '0');
  return static_cast<uint32_t>(std::tolower(static_cast<unsigned char>(hex)) - 'a' + 10);
}

class FlatObjectReader {
 public:
  explicit FlatObjectReader(std::string_view text) : text_(text) {}

  bool read(JsonObject& out) {
    skipSpace();
    if (!expect('{')) return false;
    skipSpace();
    if (peek() == '}') {
      ++pos_;
      return atEnd();
    }
    while (true) {
      skipSpace();
      std::string key;
      if (!readString(key)) return false;
      skipSpace();
      if (!expect(':')) return false;
      skipSpace();
      if (!readMember(key, out)) return false;
      skipSpace();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      if (!expect('}')) return false;
      return atEnd();
    }
  }

  const std::string& error() const { return error_; }

 private:
  char peek() const { return pos_ < text_.size() ? text_[pos_] : '\0'; }

  void skipSpace() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  bool fail(const std::string& what) {
    error_ = what + " at offset " + std::to_string(pos_);
    return false;
  }

  bool expect(char chr) {
    if (peek() != chr) return fail(std::string("Expected '") + chr + "'");
    ++pos_;
    return true;
  }

  bool atEnd() {
    skipSpace();
    if (pos_ != text_.size()) return fail("Unexpected trailing text");
    return true;
  }

  bool readMember(const std::string& key, JsonObject& out) {
    JsonValue val;
    char chr = peek();
    if (chr == '"') {
      val.type = JsonValue::String;
      if (!readString(val.string_val)) return false;
    } else if (chr == 't' || chr == 'f') {
      val.type = JsonValue::Bool;
      val.bool_val = chr == 't';
      if (!readWord(val.bool_val ? "true" : "false")) return false;
    } else if (chr == 'n') {
      if (!readWord("null")) return false;
    } else if (chr == '{' || chr == '[') {
      return skipContainer();
    } else {
      val.type = JsonValue::Number;
      if (!readNumber(val.number_val)) return false;
    }
    out[key] = val;
    return true;
  }

  bool readWord(std::string_view word) {
    if (text_.substr(pos_, word.size()) != word) return fail("Invalid literal");
    pos_ += word.size();
    return true;
  }

  bool readString(std::string& out) {
    if (!expect('"')) return false;
    while (pos_ < text_.size()) {
      char chr = text_[pos_++];
      if (chr == '"') return true;
      if (chr != '\\') {
        out += chr;
        continue;
      }
      if (pos_ >= text_.size()) break;
      char esc = text_[pos_++];
      switch (esc) {
        case '"':  out += '"'; break;
        case '\\': out += '\\'; break;
        case '/':  out += '/'; break;
        case 'n':  out += '\n'; break;
        case 't':  out += '\t'; break;
        case 'r':  out += '\r'; break;
        case 'b':  out += '\b'; break;
        case 'f':  out += '\f'; break;
        case 'u': {
          uint32_t code_point = 0;
          for (int idx = 0; idx < 4; ++idx, ++pos_) {
            char hex = peek();
            if (std::isxdigit(static_cast<unsigned char>(hex)) == 0) {
              return fail("Invalid \\u escape");
            }
            code_point = code_point * 16 + hexDigitValue(hex);
          }
          appendUtf8(out, code_point);
          break;
        }
        default:
          --pos_;
          return fail("Invalid escape");
      }
    }
    return fail("Unterminated string");
  }

  bool readNumber(double& out) {
    size_t start = pos_;
    if (peek() == '-') ++pos_;
    size_t digits = pos_;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++pos_;
    if (pos_ == digits) {
      pos_ = start;
      return fail("Unexpected character");
    }
    if (peek() == '.') {
      ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++pos_;
    }
    out = std::strtod(std::string(text_.substr(start, pos_ - start)).c_str(), nullptr);
    return true;
  }

  bool skipContainer() {
    int depth = 0;
    while (pos_ < text_.size()) {
      char chr = peek();
      if (chr == '"') {
        std::string ignored;
        if (!readString(ignored)) return false;
        continue;
      }
      ++pos_;
      if (chr == '{' || chr == '[') {
        ++depth;
      } else if ((chr == '}' || chr == ']') && --depth == 0) {
        return true;
      }
    }
    return fail("Unterminated container");
  }

  std::string_view text_;
  size_t pos_ = 0;
  std::string error_;
};

}  // namespace

bool parseJsonObject(std::string_view json, JsonObject& out, std::string& error) {
  FlatObjectReader reader(json);
  if (!reader.read(out)) {
    error = reader.error();
    return false;
  }
  return true;
}

}  // namespace mtext
