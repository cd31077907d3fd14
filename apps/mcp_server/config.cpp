#include "config.h"

#include <charconv>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lancet::mcp {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Definition
// ────────────────────────────────────────────────────────────────

struct Option {
  std::string name;         // NOLINT(readability-identifier-naming)
  bool requires_value;      // NOLINT(readability-identifier-naming)
  std::string description;  // NOLINT(readability-identifier-naming)
  std::function<bool(McpServerConfig& config, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

bool handle_db(McpServerConfig& config, const std::string& value) {
  config.db_path = value;
  return true;
}

bool handle_redis(McpServerConfig& config, const std::string& value) {
  config.redis_uri = value;
  return true;
}

bool handle_schemas(McpServerConfig& config, const std::string& value) {
  config.schema_dir = value;
  return true;
}

bool handle_log_level(McpServerConfig& config, const std::string& value) {
  const auto level = logging::parse_log_level(value);
  if (!level.has_value()) {
    config.parse_errors.push_back("Invalid --log-level: " + value +
                                  " (valid: debug, info, warning, error)");
    return false;
  }
  config.log_level = *level;
  return true;
}

bool handle_max_input_length(McpServerConfig& config, const std::string& value) {
  std::size_t parsed = 0;
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
  if (ec != std::errc{} || ptr != end || parsed == 0 || parsed > kMaxConfigurableInputLength) {
    config.parse_errors.push_back("Invalid --max-input-length: " + value + " (expected 1-" +
                                  std::to_string(kMaxConfigurableInputLength) + ")");
    return false;
  }
  config.security.max_input_length = parsed;
  return true;
}

bool handle_audit_chain_verify(McpServerConfig& config, const std::string& value) {
  if (value == "off") {
    config.audit_chain_verify = AuditChainVerifyMode::kOff;
    return true;
  }
  if (value == "warn") {
    config.audit_chain_verify = AuditChainVerifyMode::kWarn;
    return true;
  }
  if (value == "fail") {
    config.audit_chain_verify = AuditChainVerifyMode::kFail;
    return true;
  }
  config.parse_errors.push_back("Invalid --audit-chain-verify: " + value +
                                " (valid: off, warn, fail)");
  return false;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<Option> build_option_registry() {
  return {
      {"--db", true, "Path to SQLite database file (security journal, domain policies)",
       handle_db},
      {"--redis", true, "Redis URI for the shared trust-state store", handle_redis},
      {"--schemas", true, "Directory holding <tool>.json response schemas", handle_schemas},
      {"--log-level", true, "Minimum log level (debug|info|warning|error)", handle_log_level},
      {"--max-input-length", true, "Input sanitizer length clamp in code points",
       handle_max_input_length},
      {"--audit-chain-verify", true, "Startup hash-chain verification (off|warn|fail)",
       handle_audit_chain_verify},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

McpServerConfig parse_args(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  McpServerConfig config;
  auto options = build_option_registry();

  // Build lookup map for O(1) option dispatch
  std::unordered_map<std::string, const Option*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      config.parse_errors.push_back("Unknown option: " + arg);
      continue;
    }

    const Option* opt = it->second;
    if (!opt->requires_value) {
      opt->handler(config, "");
    } else if (i + 1 < argc) {
      opt->handler(config, argv[++i]);
    } else {
      config.parse_errors.push_back("Option " + arg + " requires a value");
    }
  }

  return config;
}

}  // namespace lancet::mcp
