#include "lancet/trust/redis_config.h"

#include <string_view>

namespace lancet::trust {

namespace {

using ParseResult = core::Result<RedisConfig, std::string>;

// Parses a non-empty run of decimal digits no larger than max_value.
bool parse_bounded_int(const std::string_view digits, const int max_value, int& out) {
  if (digits.empty() || digits.size() > 9) {
    return false;
  }
  int value = 0;
  for (const char c : digits) {
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  if (value > max_value) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace

ParseResult parse_redis_uri(const std::string& uri) {
  if (uri.empty()) {
    return ParseResult::err("empty URI");
  }

  std::string_view view{uri};
  bool redis_scheme = false;
  if (view.starts_with("tcp://")) {
    view.remove_prefix(6);
  } else if (view.starts_with("redis://")) {
    view.remove_prefix(8);
    redis_scheme = true;
  } else {
    return ParseResult::err("unsupported scheme (expected tcp:// or redis://)");
  }

  int redis_db = 0;
  const auto slash = view.find('/');
  if (slash != std::string_view::npos) {
    if (!redis_scheme) {
      return ParseResult::err("database index is only accepted with redis://");
    }
    if (!parse_bounded_int(view.substr(slash + 1), 15, redis_db)) {
      return ParseResult::err("invalid database index");
    }
    view = view.substr(0, slash);
  }

  if (view.empty()) {
    return ParseResult::err("missing host");
  }

  std::string host;
  int port = 6379;
  const auto colon = view.rfind(':');
  if (colon == std::string_view::npos) {
    host = std::string{view};
  } else {
    host = std::string{view.substr(0, colon)};
    if (!parse_bounded_int(view.substr(colon + 1), 65535, port) || port < 1) {
      return ParseResult::err("invalid port");
    }
  }

  if (host.empty()) {
    return ParseResult::err("missing host");
  }

  return ParseResult::ok(RedisConfig{uri, host, port, redis_db});
}

std::string redis_config_to_log_string(const RedisConfig& config) {
  std::string out = config.host + ":" + std::to_string(config.port);
  if (config.redis_db != 0) {
    out += "/" + std::to_string(config.redis_db);
  }
  return out;
}

}  // namespace lancet::trust
