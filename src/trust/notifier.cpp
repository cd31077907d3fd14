#include "lancet/trust/notifier.h"

namespace lancet::trust {

nlohmann::json to_json(const BlockedDomainNotification& n) {
  return nlohmann::json{{"domain", n.domain},
                        {"reason", n.reason},
                        {"task_id", n.task_id},
                        {"cause_id", n.cause_id}};
}

std::optional<BlockedDomainNotification> notification_from_json(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("domain") || !j["domain"].is_string()) {
    return std::nullopt;
  }
  BlockedDomainNotification n;
  n.domain = j["domain"].get<std::string>();
  n.reason = j.value("reason", "");
  n.task_id = j.value("task_id", "");
  n.cause_id = j.value("cause_id", "");
  return n;
}

nlohmann::json LoggingNotifier::notify_domain_blocked(
    const BlockedDomainNotification& notification) {
  logger_.warning("domain_blocked", to_json(notification));
  return nlohmann::json{{"ok", true}, {"event", "domain_blocked"}, {"domain", notification.domain}};
}

}  // namespace lancet::trust
