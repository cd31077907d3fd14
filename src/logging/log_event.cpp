#include "lancet/logging/log_event.h"

namespace lancet::logging {

std::string_view to_string(const LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarning:
      return "warning";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::optional<LogLevel> parse_log_level(const std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warning" || value == "warn") {
    return LogLevel::kWarning;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

nlohmann::json to_json(const LogEvent& event) {
  nlohmann::json out;
  out["timestamp"] = event.timestamp;
  out["level"] = std::string(to_string(event.level));
  out["logger"] = event.logger;
  out["message"] = event.message;

  if (!event.fields.is_object()) {
    if (!event.fields.is_null()) {
      out["fields"] = event.fields;
    }
    return out;
  }

  nlohmann::json collisions = nlohmann::json::object();
  for (const auto& [key, value] : event.fields.items()) {
    if (out.contains(key)) {
      collisions[key] = value;
    } else {
      out[key] = value;
    }
  }
  if (!collisions.empty()) {
    out["fields"] = std::move(collisions);
  }
  return out;
}

}  // namespace lancet::logging
