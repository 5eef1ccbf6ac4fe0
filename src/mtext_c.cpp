// Implementation of C API for WASM and FFI bindings.

#include "mtext_c.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <string_view>

#include "core/json_helpers.h"
#include "core/json_parser.h"
#include "core/version_info.h"
#include "music_text.h"

namespace {

/// @brief Internal state held per MtextHandle.
struct MtextInstance {
  mtext::ParseResult result;
  std::string last_error;
  bool has_document = false;
};

/// @brief Apply flat JSON options over the defaults.
/// @return False if "format" names an unknown back-end.
bool optionsFromJson(const mtext::JsonObject& kv,
                     mtext::RenderOptions& options, mtext::OutputFormat& format) {
  auto it = kv.find("format");
  if (it != kv.end() && it->second.type == mtext::JsonValue::String) {
    if (!mtext::outputFormatFromString(it->second.string_val, format)) return false;
  }

  it = kv.find("include_header");
  if (it != kv.end()) {
    options.include_header = it->second.asBool(options.include_header);
  }

  it = kv.find("include_lyrics");
  if (it != kv.end()) {
    options.include_lyrics = it->second.asBool(options.include_lyrics);
  }

  it = kv.find("pretty");
  if (it != kv.end()) {
    options.pretty_json = it->second.asBool(options.pretty_json);
  }

  it = kv.find("lilypond_version");
  if (it != kv.end() && it->second.type == mtext::JsonValue::String &&
      !it->second.string_val.empty()) {
    options.lilypond_version = it->second.string_val;
  }
  return true;
}

/// @brief Copy a string into a malloc'd MtextOutput.
MtextOutput* makeOutput(const std::string& text) {
  auto* output = static_cast<MtextOutput*>(malloc(sizeof(MtextOutput)));
  if (!output) return nullptr;

  output->length = text.size();
  output->text = static_cast<char*>(malloc(output->length + 1));
  if (!output->text) {
    free(output);
    return nullptr;
  }

  memcpy(output->text, text.c_str(), output->length + 1);
  return output;
}

void setError(MtextError* error, MtextError code) {
  if (error) *error = code;
}

}  // namespace

extern "C" {

// ============================================================================
// Lifecycle
// ============================================================================

MtextHandle mtext_create(void) {
  return new MtextInstance();
}

void mtext_destroy(MtextHandle handle) {
  delete static_cast<MtextInstance*>(handle);
}

// ============================================================================
// Parsing
// ============================================================================

MtextError mtext_parse(MtextHandle handle, const char* text, size_t length) {
  if (!handle || (!text && length > 0)) {
    return MTEXT_ERROR_INVALID_PARAM;
  }

  auto* instance = static_cast<MtextInstance*>(handle);
  std::string_view input = text ? std::string_view(text, length) : std::string_view();
  instance->result = mtext::parse(input);
  instance->has_document = true;

  if (!instance->result.success) {
    instance->last_error = instance->result.error_message;
    return MTEXT_ERROR_PARSE_FAILED;
  }
  instance->last_error.clear();
  return MTEXT_OK;
}

MtextOutput* mtext_render(MtextHandle handle, const char* format, const char* options_json,
                          size_t length, MtextError* error) {
  if (!handle) {
    setError(error, MTEXT_ERROR_INVALID_PARAM);
    return nullptr;
  }

  auto* instance = static_cast<MtextInstance*>(handle);
  if (!instance->has_document) {
    instance->last_error = "No document has been parsed";
    setError(error, MTEXT_ERROR_NO_DOCUMENT);
    return nullptr;
  }

  mtext::RenderOptions options;
  mtext::OutputFormat out_format = mtext::OutputFormat::Lilypond;
  if (options_json && length > 0) {
    mtext::JsonObject kv;
    std::string json_error;
    if (!mtext::parseJsonObject(std::string_view(options_json, length), kv, json_error)) {
      instance->last_error = "Invalid options JSON: " + json_error;
      setError(error, MTEXT_ERROR_INVALID_PARAM);
      return nullptr;
    }
    if (!optionsFromJson(kv, options, out_format)) {
      instance->last_error = "Unknown output format in options";
      setError(error, MTEXT_ERROR_INVALID_FORMAT);
      return nullptr;
    }
  }
  if (format && !mtext::outputFormatFromString(format, out_format)) {
    instance->last_error = std::string("Unknown output format '") + format + "'";
    setError(error, MTEXT_ERROR_INVALID_FORMAT);
    return nullptr;
  }

  std::string text = mtext::render(instance->result.document, out_format, options);
  MtextOutput* output = makeOutput(text);
  setError(error, output ? MTEXT_OK : MTEXT_ERROR_INVALID_PARAM);
  return output;
}

void mtext_free_output(MtextOutput* output) {
  if (output) {
    free(output->text);
    free(output);
  }
}

MtextOutput* mtext_get_warnings(MtextHandle handle) {
  if (!handle) return nullptr;
  auto* instance = static_cast<MtextInstance*>(handle);

  mtext::JsonWriter writer;
  writer.beginArray();
  for (const auto& warning : instance->result.warnings) {
    writer.value(warning);
  }
  writer.endArray();
  return makeOutput(writer.toString());
}

// ============================================================================
// Error Handling
// ============================================================================

const char* mtext_error_string(MtextError error) {
  switch (error) {
    case MTEXT_OK: return "No error";
    case MTEXT_ERROR_INVALID_PARAM: return "Invalid parameter";
    case MTEXT_ERROR_PARSE_FAILED: return "Parse failed";
    case MTEXT_ERROR_NO_DOCUMENT: return "No parsed document";
    case MTEXT_ERROR_INVALID_FORMAT: return "Invalid output format";
  }
  return "Unknown error";
}

const char* mtext_last_error_message(MtextHandle handle) {
  if (!handle) return "";
  return static_cast<MtextInstance*>(handle)->last_error.c_str();
}

// ============================================================================
// Utilities
// ============================================================================

const char* mtext_version(void) {
  return MTEXT_VERSION;
}

}  // extern "C"
