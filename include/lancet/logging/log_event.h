#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lancet::logging {

enum class LogLevel {
  kDebug,
  kInfo,
  kWarning,
  kError,
};

[[nodiscard]] std::string_view to_string(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);

// LogEvent is one self-contained structured record. Rendering it needs no external state.
struct LogEvent {
  LogLevel level{LogLevel::kInfo};                 // NOLINT(readability-identifier-naming)
  std::string logger;                              // NOLINT(readability-identifier-naming)
  std::string message;                             // NOLINT(readability-identifier-naming)
  nlohmann::json fields{nlohmann::json::object()};  // NOLINT(readability-identifier-naming)
  std::string timestamp;                           // NOLINT(readability-identifier-naming)
};

// to_json renders {timestamp, level, logger, message, ...fields}. Field keys that collide with
// the envelope keys are nested under "fields" instead of overwriting them.
[[nodiscard]] nlohmann::json to_json(const LogEvent& event);

}  // namespace lancet::logging
