#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lancet::storage {

enum class SecurityEventType {
  kDangerousPatternDetected,
  kPromptLeakageDetected,
  kTagPatternRemoved,
  kSuspiciousUrlDetected,
  kSuspiciousIpDetected,
  kOutputTruncated,
  kUnknownFieldRemoved,
  kLlmFieldSanitized,
  kErrorSanitized,
  kExternalAccessBlocked,
  kDomainBlocked,
  kDomainUnblocked,
};

enum class Severity {
  kLow,
  kMedium,
  kHigh,
  kCritical,
};

[[nodiscard]] std::string to_string(SecurityEventType type);
[[nodiscard]] std::string to_string(Severity severity);
[[nodiscard]] std::optional<SecurityEventType> parse_security_event_type(std::string_view value);
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view value);

// SecurityEvent is one append-only journal entry. Events sharing a task_id form one hash chain;
// events without a task belong to the chain keyed by the empty string.
struct SecurityEvent {
  std::string event_id;                                          // NOLINT(readability-identifier-naming)
  SecurityEventType event_type{SecurityEventType::kErrorSanitized};  // NOLINT(readability-identifier-naming)
  Severity severity{Severity::kLow};                             // NOLINT(readability-identifier-naming)
  nlohmann::json details = nlohmann::json::object();             // NOLINT(readability-identifier-naming)
  std::string task_id;                                           // NOLINT(readability-identifier-naming)
  std::string created_at;                                        // NOLINT(readability-identifier-naming)
  std::string previous_hash{};                                   // NOLINT(readability-identifier-naming)
  std::string event_hash{};                                      // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const SecurityEvent& event);

}  // namespace lancet::storage
