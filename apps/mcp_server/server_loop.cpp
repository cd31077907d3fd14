#include "server_loop.h"

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "method_handlers.h"
#include <string>

namespace lancet::mcp {

using json = nlohmann::json;

void run_server_loop(ServerContext& ctx, std::istream& in, std::ostream& out) {
  const auto& log = ctx.secure_log.logger();
  // Method registry
  auto method_registry = build_method_registry();

  // Main loop: one JSON-RPC request per input line, one response per output line
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    auto request_opt = parse_request(line);
    if (!request_opt.has_value()) {
      out << make_error_response(std::nullopt, kParseError, "Invalid JSON") << "\n" << std::flush;
      continue;
    }

    const auto& request = request_opt.value();
    log.debug("request_received", {{"method", request.method}});

    if (request.jsonrpc != "2.0" || request.method.empty()) {
      if (!request.is_notification()) {
        out << make_error_response(request.id, kInvalidRequest, "Invalid JSON-RPC request")
            << "\n"
            << std::flush;
      }
      continue;
    }

    // Dispatch via method registry
    auto it = method_registry.find(request.method);
    if (it == method_registry.end()) {
      if (!request.is_notification()) {
        out << make_error_response(request.id, kMethodNotFound, "Unknown method: " + request.method)
            << "\n"
            << std::flush;
      }
      continue;
    }

    json result = it->second(request, ctx);
    if (!request.is_notification()) {
      out << make_response(request.id, result) << "\n" << std::flush;
    }

    if (request.method == "tools/call") {
      deliver_pending_notifications(ctx);
    }
  }

  log.info("server_shutdown");
}

}  // namespace lancet::mcp
