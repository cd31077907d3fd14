#pragma once

#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/logging/logger.h"
#include "lancet/storage/security_event_log.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace lancet::logging {

// AuditLogger records security events. The full details go only to the journal; the
// operational log gets the id, type, severity and task.
class AuditLogger {
 public:
  AuditLogger(storage::ISecurityEventLog& journal, Logger logger, core::IIdGenerator& id_gen,
              core::IClock& clock)
      : journal_(&journal), logger_(std::move(logger)), id_gen_(&id_gen), clock_(&clock) {}

  // Returns the generated event id ("sec_" + 16 hex). A journal failure is logged as an error;
  // the id is still returned so callers can correlate.
  std::string log_security_event(storage::SecurityEventType type, storage::Severity severity,
                                 nlohmann::json details = nlohmann::json::object(),
                                 const std::string& task_id = "") const;

  // Leaked markers are recorded by count and SHA-256 prefix only.
  std::string log_prompt_leakage(const std::vector<std::string>& markers,
                                 const std::string& source, const std::string& task_id = "") const;

  std::string log_dangerous_pattern(const std::vector<std::string>& patterns,
                                    const std::string& source,
                                    const std::string& task_id = "") const;

 private:
  storage::ISecurityEventLog* journal_;
  Logger logger_;
  core::IIdGenerator* id_gen_;
  core::IClock* clock_;
};

}  // namespace lancet::logging
