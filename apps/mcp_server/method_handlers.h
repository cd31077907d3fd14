#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <string>
#include <unordered_map>

namespace lancet::mcp {

using MethodHandler = std::function<nlohmann::json(const JsonRpcRequest& req, ServerContext& ctx)>;

nlohmann::json handle_initialize(const JsonRpcRequest& req, ServerContext& ctx);
nlohmann::json handle_tools_list(const JsonRpcRequest& req, ServerContext& ctx);

// handle_tools_call dispatches to the tool, attaches response metadata and filters the payload
// through the tool's schema. Any exception becomes a sanitized error payload.
nlohmann::json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx);

// call_tool returns the sanitized tool payload before it is wrapped as MCP content.
nlohmann::json call_tool(const std::string& tool_name, const nlohmann::json& arguments,
                         ServerContext& ctx);

// deliver_pending_notifications drains the blocked-domain queue through ctx.notifier and waits
// for delivery. Returns the number delivered.
std::size_t deliver_pending_notifications(ServerContext& ctx);

std::unordered_map<std::string, MethodHandler> build_method_registry();

}  // namespace lancet::mcp
