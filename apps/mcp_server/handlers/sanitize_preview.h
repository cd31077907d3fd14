#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace lancet::mcp::handlers {

// sanitize_preview runs the input sanitizer on params.text and reports what it changed.
// With params.output, the text is also checked as model output against a fresh session tag.
nlohmann::json handle_sanitize_preview(const nlohmann::json& params, ServerContext& ctx);

}  // namespace lancet::mcp::handlers
