#include "startup_guard.h"

#include "lancet/trust/redis_config.h"

#include <filesystem>
#include <system_error>

namespace lancet::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (!config.parse_errors.empty()) {
    return "Error: " + config.parse_errors.front();
  }

  // Validate Redis URI format before attempting to connect.
  if (config.redis_uri.has_value()) {
    const auto parsed = trust::parse_redis_uri(config.redis_uri.value());
    if (!parsed.has_value()) {
      return "Error: --redis URI '" + config.redis_uri.value() +
             "' is not a valid Redis URI: " + parsed.error() +
             "\n"
             "       Accepted formats: tcp://host:port, redis://host:port/db, tcp://host";
    }
  }

  std::error_code ec;
  if (!std::filesystem::is_directory(config.schema_dir, ec)) {
    return "Error: --schemas directory '" + config.schema_dir +
           "' does not exist.\n"
           "       Every tool response is filtered through <dir>/<tool>.json.";
  }

  const std::string security_error = core::validate_security_config(config.security);
  if (!security_error.empty()) {
    return "Error: invalid security configuration: " + security_error;
  }

  return "";
}

}  // namespace lancet::mcp
