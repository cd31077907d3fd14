#include "lancet/storage/security_event.h"

#include <array>
#include <utility>

namespace lancet::storage {

namespace {

constexpr std::array<std::pair<SecurityEventType, std::string_view>, 12> kEventTypeNames{{
    {SecurityEventType::kDangerousPatternDetected, "dangerous_pattern_detected"},
    {SecurityEventType::kPromptLeakageDetected, "prompt_leakage_detected"},
    {SecurityEventType::kTagPatternRemoved, "tag_pattern_removed"},
    {SecurityEventType::kSuspiciousUrlDetected, "suspicious_url_detected"},
    {SecurityEventType::kSuspiciousIpDetected, "suspicious_ip_detected"},
    {SecurityEventType::kOutputTruncated, "output_truncated"},
    {SecurityEventType::kUnknownFieldRemoved, "unknown_field_removed"},
    {SecurityEventType::kLlmFieldSanitized, "llm_field_sanitized"},
    {SecurityEventType::kErrorSanitized, "error_sanitized"},
    {SecurityEventType::kExternalAccessBlocked, "external_access_blocked"},
    {SecurityEventType::kDomainBlocked, "domain_blocked"},
    {SecurityEventType::kDomainUnblocked, "domain_unblocked"},
}};

constexpr std::array<std::pair<Severity, std::string_view>, 4> kSeverityNames{{
    {Severity::kLow, "low"},
    {Severity::kMedium, "medium"},
    {Severity::kHigh, "high"},
    {Severity::kCritical, "critical"},
}};

}  // namespace

std::string to_string(const SecurityEventType type) {
  for (const auto& [value, name] : kEventTypeNames) {
    if (value == type) {
      return std::string{name};
    }
  }
  return "unknown";
}

std::string to_string(const Severity severity) {
  for (const auto& [value, name] : kSeverityNames) {
    if (value == severity) {
      return std::string{name};
    }
  }
  return "unknown";
}

std::optional<SecurityEventType> parse_security_event_type(const std::string_view value) {
  for (const auto& [type, name] : kEventTypeNames) {
    if (name == value) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<Severity> parse_severity(const std::string_view value) {
  for (const auto& [severity, name] : kSeverityNames) {
    if (name == value) {
      return severity;
    }
  }
  return std::nullopt;
}

nlohmann::json to_json(const SecurityEvent& event) {
  nlohmann::json j{{"event_id", event.event_id},
                   {"event_type", to_string(event.event_type)},
                   {"severity", to_string(event.severity)},
                   {"details", event.details},
                   {"created_at", event.created_at},
                   {"previous_hash", event.previous_hash},
                   {"event_hash", event.event_hash}};
  if (!event.task_id.empty()) {
    j["task_id"] = event.task_id;
  }
  return j;
}

}  // namespace lancet::storage
