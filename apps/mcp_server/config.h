#pragma once

#include "lancet/core/security_config.h"
#include "lancet/logging/log_event.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lancet::mcp {

// AuditChainVerifyMode controls startup-time SHA-256 hash-chain verification of the security
// event journal.
//   kOff   no verification (default)
//   kWarn  verify every task chain; print a warning for each corrupt chain
//   kFail  verify every task chain; refuse to start if any chain is corrupt
enum class AuditChainVerifyMode {
  kOff,   // NOLINT(readability-identifier-naming)
  kWarn,  // NOLINT(readability-identifier-naming)
  kFail,  // NOLINT(readability-identifier-naming)
};

inline constexpr const char* kDefaultSchemaDir = "schemas";
inline constexpr std::size_t kMaxConfigurableInputLength = 1000000;

// McpServerConfig holds all parsed startup flags for the MCP server.
// Every field has an explicit default; optional fields mean "not configured".
struct McpServerConfig {
  std::optional<std::string> db_path;    // NOLINT(readability-identifier-naming)
  std::optional<std::string> redis_uri;  // NOLINT(readability-identifier-naming)
  std::string schema_dir{kDefaultSchemaDir};  // NOLINT(readability-identifier-naming)
  logging::LogLevel log_level{logging::LogLevel::kInfo};  // NOLINT(readability-identifier-naming)
  core::SecurityConfig security;         // NOLINT(readability-identifier-naming)
  AuditChainVerifyMode audit_chain_verify{// NOLINT(readability-identifier-naming)
                                          AuditChainVerifyMode::kOff};
  // Unknown options and rejected values, in command-line order.
  std::vector<std::string> parse_errors;  // NOLINT(readability-identifier-naming)
};

McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

}  // namespace lancet::mcp
