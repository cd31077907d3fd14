#pragma once

namespace lancet::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "0.3";

// kServerName is reported by the MCP initialize handshake.
constexpr const char* kServerName = "lancet-mcp";

}  // namespace lancet::core
