#include "mcp_protocol.h"

namespace lancet::mcp {

std::optional<JsonRpcRequest> parse_request(const std::string& json_str) {
  auto json = nlohmann::json::parse(json_str, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    return std::nullopt;
  }

  JsonRpcRequest request;
  if (const auto it = json.find("jsonrpc"); it != json.end() && it->is_string()) {
    request.jsonrpc = it->get<std::string>();
  }

  if (const auto it = json.find("id"); it != json.end() && (it->is_string() || it->is_number())) {
    request.id = *it;
  }

  if (const auto it = json.find("method"); it != json.end() && it->is_string()) {
    request.method = it->get<std::string>();
  }

  if (const auto it = json.find("params"); it != json.end() && it->is_object()) {
    request.params = *it;
  } else {
    request.params = nlohmann::json::object();
  }

  return request;
}

namespace {

nlohmann::json envelope(const std::optional<nlohmann::json>& id) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : nlohmann::json(nullptr);
  return response;
}

}  // namespace

std::string make_response(const std::optional<nlohmann::json>& id, const nlohmann::json& result) {
  auto response = envelope(id);
  response["result"] = result;
  return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string make_error_response(const std::optional<nlohmann::json>& id, int code,
                                const std::string& message, const nlohmann::json& data) {
  auto response = envelope(id);
  response["error"] = {
      {"code", code},
      {"message", message},
      {"data", data},
  };
  return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace lancet::mcp
