// C API for WASM and FFI bindings.

#ifndef MTEXT_C_H
#define MTEXT_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a parser instance.
typedef void* MtextHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  MTEXT_OK = 0,
  MTEXT_ERROR_INVALID_PARAM = 1,
  MTEXT_ERROR_PARSE_FAILED = 2,
  MTEXT_ERROR_NO_DOCUMENT = 3,
  MTEXT_ERROR_INVALID_FORMAT = 4,
} MtextError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief Rendered text output.
typedef struct {
  char* text;     ///< Null-terminated output
  size_t length;  ///< Length without the terminator
} MtextOutput;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new parser instance.
/// @return Handle (must be freed with mtext_destroy)
MtextHandle mtext_create(void);

/// @brief Destroy a parser instance.
/// @param handle Handle to destroy
void mtext_destroy(MtextHandle handle);

// ============================================================================
// Parsing
// ============================================================================

/// @brief Parse notation text and keep the document in the handle.
///
/// On MTEXT_ERROR_PARSE_FAILED the partial document is kept and
/// mtext_last_error_message() returns "line L, column C: message".
/// @param handle Parser handle
/// @param text UTF-8 input
/// @param length Length of the input in bytes
/// @return MTEXT_OK on success
MtextError mtext_parse(MtextHandle handle, const char* text, size_t length);

/// @brief Render the last parsed document.
///
/// JSON options (all optional):
///   format: string ("lilypond", "json", "spans", "document")
///   include_header: boolean
///   include_lyrics: boolean
///   pretty: boolean
///   lilypond_version: string
///
/// The format argument wins over a "format" option when not null.
/// Malformed options_json fails with MTEXT_ERROR_INVALID_PARAM.
/// @param handle Parser handle
/// @param format Format name or null
/// @param options_json Flat JSON object or null
/// @param length Length of options_json
/// @param error Receives the error code (may be null)
/// @return Output (must be freed with mtext_free_output), or null on error
MtextOutput* mtext_render(MtextHandle handle, const char* format, const char* options_json,
                          size_t length, MtextError* error);

/// @brief Free rendered output.
/// @param output Pointer returned by mtext_render
void mtext_free_output(MtextOutput* output);

/// @brief Warnings of the last parse as a JSON array of strings.
/// @param handle Parser handle
/// @return Output (must be freed with mtext_free_output)
MtextOutput* mtext_get_warnings(MtextHandle handle);

// ============================================================================
// Error Handling
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* mtext_error_string(MtextError error);

/// @brief Detailed message of the last failed call on this handle.
/// @param handle Parser handle
/// @return Message owned by the handle, empty if none
const char* mtext_last_error_message(MtextHandle handle);

// ============================================================================
// Utilities
// ============================================================================

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* mtext_version(void);

#ifdef __cplusplus
}
#endif

#endif  // MTEXT_C_H
