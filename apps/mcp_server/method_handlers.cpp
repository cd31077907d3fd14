#include "method_handlers.h"

#include "lancet/core/version.h"
#include "lancet/response/errors.h"
#include "lancet/response/response_meta.h"

#include "handlers/tool_registry.h"

namespace lancet::mcp {

using json = nlohmann::json;

namespace {

std::string task_id_of(const json& arguments) {
  const auto it = arguments.find("task_id");
  return (it != arguments.end() && it->is_string()) ? it->get<std::string>() : "";
}

}  // namespace

json handle_initialize(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{
      {"protocolVersion", "2024-11-05"},
      {"capabilities", {{"tools", json::object()}}},
      {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
  };
}

json handle_tools_list(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return json{{"tools", handlers::tool_definitions()}};
}

json call_tool(const std::string& tool_name, const json& arguments, ServerContext& ctx) {
  static const auto tool_registry = handlers::build_tool_registry();

  try {
    const auto it = tool_registry.find(tool_name);
    if (it == tool_registry.end()) {
      throw response::invalid_params("Unknown tool: " + tool_name, "name");
    }
    if (!arguments.is_object()) {
      throw response::invalid_params("arguments must be an object", "arguments");
    }

    json payload = it->second(arguments, ctx);
    if (!payload.is_object() || !payload.contains(response::kMetaKey)) {
      payload = response::attach_meta(std::move(payload),
                                      response::create_minimal_meta(ctx.clock.now_iso8601()));
    }
    return ctx.services.sanitizer
        .sanitize_response(payload, tool_name, std::nullopt, task_id_of(arguments))
        .response;
  } catch (const std::exception& e) {
    const std::string error_id = ctx.id_gen.next("err");
    ctx.secure_log.log_exception(e, error_id);
    return ctx.services.sanitizer.sanitize_error(e, error_id);
  }
}

json handle_tools_call(const JsonRpcRequest& req, ServerContext& ctx) {
  const auto name = req.params.find("name");
  const std::string tool_name =
      (name != req.params.end() && name->is_string()) ? name->get<std::string>() : "";
  const json arguments = req.params.value("arguments", json::object());

  const json payload = call_tool(tool_name, arguments, ctx);
  const bool is_error = payload.is_object() && payload.contains("ok") && payload["ok"].is_boolean() &&
                        !payload["ok"].get<bool>();

  return json{
      {"content",
       json::array({{{"type", "text"},
                     {"text", payload.dump(-1, ' ', false, json::error_handler_t::replace)}}})},
      {"structuredContent", payload},
      {"isError", is_error},
  };
}

std::size_t deliver_pending_notifications(ServerContext& ctx) {
  auto& verifier = ctx.services.verifier;
  if (verifier.get_pending_notification_count() == 0) {
    return 0;
  }
  const auto outcomes = verifier.send_pending_notifications(ctx.notifier).get();
  std::size_t delivered = 0;
  for (const auto& outcome : outcomes) {
    if (outcome.delivered) {
      ++delivered;
    }
  }
  ctx.secure_log.logger().info("notifications_delivered",
                               {{"delivered", delivered}, {"failed", outcomes.size() - delivered}});
  return delivered;
}

std::unordered_map<std::string, MethodHandler> build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

}  // namespace lancet::mcp
