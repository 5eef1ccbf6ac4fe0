// Debug dump of a resolved Document as JSON.

#ifndef MTEXT_RENDER_DOCUMENT_JSON_RENDERER_H
#define MTEXT_RENDER_DOCUMENT_JSON_RENDERER_H

#include <string>

#include "parse/document_types.h"
#include "render/render_options.h"

namespace mtext {

/// @brief Serialize directives, staves, lines, elements, children and rhythm items.
std::string renderDocumentJson(const Document& document, const RenderOptions& options);

}  // namespace mtext

#endif  // MTEXT_RENDER_DOCUMENT_JSON_RENDERER_H
