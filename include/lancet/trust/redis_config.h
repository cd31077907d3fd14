#pragma once

#include "lancet/core/result.h"

#include <string>

namespace lancet::trust {

// RedisConfig holds a parsed and validated Redis URI.
//
// URI formats accepted:
//   tcp://host:port
//   redis://host:port
//   tcp://host          (port defaults to 6379)
//   redis://host:port/N (N = database index, redis:// scheme only)
struct RedisConfig {
  std::string uri;   // NOLINT(readability-identifier-naming)
  std::string host;  // NOLINT(readability-identifier-naming)
  int port{6379};    // NOLINT(readability-identifier-naming)
  int redis_db{0};   // NOLINT(readability-identifier-naming)
};

// parse_redis_uri parses a Redis URI. The error names the first rule the URI breaks.
// No dependency on redis++.
[[nodiscard]] core::Result<RedisConfig, std::string> parse_redis_uri(const std::string& uri);

// redis_config_to_log_string renders "host:port" or "host:port/N" for startup diagnostics.
[[nodiscard]] std::string redis_config_to_log_string(const RedisConfig& config);

}  // namespace lancet::trust
