#include <catch2/catch_test_macros.hpp>

#include "config.h"
#include "startup_guard.h"

#include <string>
#include <vector>

using namespace lancet::mcp;

namespace {

// Helper: run parse_args over a vector of arguments (argv[0] is supplied).
McpServerConfig parse(std::vector<std::string> args) {
  args.insert(args.begin(), "lancet_mcp_server");
  std::vector<char*> argv;
  argv.reserve(args.size());
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

McpServerConfig valid_config() {
  McpServerConfig config;
  config.schema_dir = LANCET_SCHEMA_DIR;
  return config;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

}  // namespace

// ── parse_args ──────────────────────────────────────────────────────────────

TEST_CASE("parse_args: defaults when no flags are given", "[startup][config]") {
  const auto config = parse({});
  CHECK_FALSE(config.db_path.has_value());
  CHECK_FALSE(config.redis_uri.has_value());
  CHECK(config.schema_dir == kDefaultSchemaDir);
  CHECK(config.log_level == lancet::logging::LogLevel::kInfo);
  CHECK(config.audit_chain_verify == AuditChainVerifyMode::kOff);
  CHECK(config.security.max_input_length == lancet::core::kDefaultMaxInputLength);
  CHECK(config.parse_errors.empty());
}

TEST_CASE("parse_args: every flag is applied", "[startup][config]") {
  const auto config = parse({"--db", "/var/lib/lancet.db", "--redis", "tcp://127.0.0.1:6379",
                             "--schemas", "/etc/lancet/schemas", "--log-level", "debug",
                             "--max-input-length", "8000", "--audit-chain-verify", "fail"});
  CHECK(config.db_path == "/var/lib/lancet.db");
  CHECK(config.redis_uri == "tcp://127.0.0.1:6379");
  CHECK(config.schema_dir == "/etc/lancet/schemas");
  CHECK(config.log_level == lancet::logging::LogLevel::kDebug);
  CHECK(config.security.max_input_length == 8000);
  CHECK(config.audit_chain_verify == AuditChainVerifyMode::kFail);
  CHECK(config.parse_errors.empty());
}

TEST_CASE("parse_args: rejected values are collected in order", "[startup][config]") {
  const auto config = parse({"--bogus", "--log-level", "loud", "--max-input-length", "0",
                             "--audit-chain-verify", "maybe", "--db"});
  REQUIRE(config.parse_errors.size() == 5);
  CHECK(config.parse_errors[0] == "Unknown option: --bogus");
  CHECK(starts_with(config.parse_errors[1], "Invalid --log-level: loud"));
  CHECK(starts_with(config.parse_errors[2], "Invalid --max-input-length: 0"));
  CHECK(starts_with(config.parse_errors[3], "Invalid --audit-chain-verify: maybe"));
  CHECK(config.parse_errors[4] == "Option --db requires a value");
}

TEST_CASE("parse_args: max input length must be a plain number in range", "[startup][config]") {
  CHECK_FALSE(parse({"--max-input-length", "12abc"}).parse_errors.empty());
  CHECK_FALSE(parse({"--max-input-length", "-5"}).parse_errors.empty());
  CHECK_FALSE(parse({"--max-input-length", "1000001"}).parse_errors.empty());
  CHECK(parse({"--max-input-length", "1000000"}).parse_errors.empty());
}

// ── validate_mcp_server_config ──────────────────────────────────────────────

TEST_CASE("validate_mcp_server_config: defaults with a schema directory pass",
          "[startup][config]") {
  CHECK(validate_mcp_server_config(valid_config()).empty());
}

TEST_CASE("validate_mcp_server_config: redis is optional but must parse", "[startup][config]") {
  auto config = valid_config();
  config.redis_uri = "redis://127.0.0.1:6379/2";
  CHECK(validate_mcp_server_config(config).empty());

  config.redis_uri = "not-a-valid-uri";
  const auto error = validate_mcp_server_config(config);
  CHECK(starts_with(error, "Error: --redis URI 'not-a-valid-uri'"));
}

TEST_CASE("validate_mcp_server_config: parse errors are reported first", "[startup][config]") {
  auto config = valid_config();
  config.redis_uri = "not-a-valid-uri";
  config.parse_errors.push_back("Unknown option: --bogus");
  CHECK(validate_mcp_server_config(config) == "Error: Unknown option: --bogus");
}

TEST_CASE("validate_mcp_server_config: missing schema directory is rejected",
          "[startup][config]") {
  auto config = valid_config();
  config.schema_dir = std::string(LANCET_SCHEMA_DIR) + "/does-not-exist";
  CHECK(starts_with(validate_mcp_server_config(config), "Error: --schemas directory"));
}

TEST_CASE("validate_mcp_server_config: unusable security settings are rejected",
          "[startup][config]") {
  auto config = valid_config();
  config.security.tag_prefix = "BAD-PREFIX";
  CHECK(validate_mcp_server_config(config) ==
        "Error: invalid security configuration: tag_prefix must be alphanumeric: BAD-PREFIX");

  config = valid_config();
  config.security.max_rejection_rate = 1.0;
  CHECK_FALSE(validate_mcp_server_config(config).empty());
}
