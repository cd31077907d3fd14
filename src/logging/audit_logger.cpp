#include "lancet/logging/audit_logger.h"

#include "lancet/core/sha256.h"

namespace lancet::logging {

namespace {

LogLevel level_for(const storage::Severity severity) {
  switch (severity) {
    case storage::Severity::kLow:
      return LogLevel::kInfo;
    case storage::Severity::kMedium:
    case storage::Severity::kHigh:
      return LogLevel::kWarning;
    case storage::Severity::kCritical:
      return LogLevel::kError;
  }
  return LogLevel::kWarning;
}

}  // namespace

std::string AuditLogger::log_security_event(const storage::SecurityEventType type,
                                            const storage::Severity severity,
                                            nlohmann::json details,
                                            const std::string& task_id) const {
  storage::SecurityEvent event;
  event.event_id = id_gen_->next("sec");
  event.event_type = type;
  event.severity = severity;
  event.details = std::move(details);
  event.task_id = task_id;
  event.created_at = clock_->now_iso8601();

  nlohmann::json fields{{"event_id", event.event_id},
                        {"event_type", storage::to_string(type)},
                        {"severity", storage::to_string(severity)}};
  if (!task_id.empty()) {
    fields["task_id"] = task_id;
  }

  const auto stored = journal_->append(event);
  if (!stored.has_value()) {
    fields["journal_error"] = stored.error();
    logger_.error("security_event_not_journaled", std::move(fields));
    return event.event_id;
  }

  logger_.log(level_for(severity), "security_event", std::move(fields));
  return event.event_id;
}

std::string AuditLogger::log_prompt_leakage(const std::vector<std::string>& markers,
                                            const std::string& source,
                                            const std::string& task_id) const {
  nlohmann::json hashes = nlohmann::json::array();
  for (const auto& marker : markers) {
    hashes.push_back(core::sha256_prefix(marker, 16));
  }
  return log_security_event(storage::SecurityEventType::kPromptLeakageDetected,
                            storage::Severity::kHigh,
                            {{"source", source},
                             {"marker_count", markers.size()},
                             {"marker_hashes", std::move(hashes)}},
                            task_id);
}

std::string AuditLogger::log_dangerous_pattern(const std::vector<std::string>& patterns,
                                               const std::string& source,
                                               const std::string& task_id) const {
  return log_security_event(storage::SecurityEventType::kDangerousPatternDetected,
                            storage::Severity::kHigh,
                            {{"source", source}, {"patterns", patterns}}, task_id);
}

}  // namespace lancet::logging
