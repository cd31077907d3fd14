#pragma once

#include "lancet/logging/logger.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace lancet::trust {

// BlockedDomainNotification is queued when a domain becomes BLOCKED. At most one per domain is
// queued at a time.
struct BlockedDomainNotification {
  std::string domain;    // NOLINT(readability-identifier-naming)
  std::string reason;    // NOLINT(readability-identifier-naming)
  std::string task_id;   // NOLINT(readability-identifier-naming)
  std::string cause_id;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const BlockedDomainNotification& n);
[[nodiscard]] std::optional<BlockedDomainNotification> notification_from_json(
    const nlohmann::json& j);

// INotifier delivers a blocked-domain notification to the operator channel.
// Delivery failures are reported by throwing; SourceVerifier catches them per domain.
class INotifier {
 public:
  virtual ~INotifier() = default;

  // Returns a delivery receipt included in the notification outcome.
  virtual nlohmann::json notify_domain_blocked(const BlockedDomainNotification& notification) = 0;

 protected:
  INotifier() = default;
  INotifier(const INotifier&) = default;
  INotifier& operator=(const INotifier&) = default;
  INotifier(INotifier&&) = default;
  INotifier& operator=(INotifier&&) = default;
};

// LoggingNotifier writes each notification as a warning event.
class LoggingNotifier final : public INotifier {
 public:
  explicit LoggingNotifier(logging::Logger logger) : logger_(std::move(logger)) {}

  nlohmann::json notify_domain_blocked(const BlockedDomainNotification& notification) override;

 private:
  logging::Logger logger_;
};

}  // namespace lancet::trust
