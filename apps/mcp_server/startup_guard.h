#pragma once

#include "config.h"
#include <string>

namespace lancet::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - no unknown options or rejected flag values
// - if redis_uri is present, parse_redis_uri() must succeed (format valid)
// - schema_dir names an existing directory
// - the security configuration is usable
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace lancet::mcp
