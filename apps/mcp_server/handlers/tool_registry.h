#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace lancet::mcp::handlers {

// ToolHandler returns the tool payload, or throws: response::McpToolError for client errors,
// anything else becomes INTERNAL_ERROR.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& params, ServerContext& ctx)>;

std::unordered_map<std::string, ToolHandler> build_tool_registry();

// tool_definitions returns the tools/list entries (name, description, inputSchema).
nlohmann::json tool_definitions();

}  // namespace lancet::mcp::handlers
