#pragma once

#include "lancet/core/result.h"
#include "lancet/storage/security_event.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lancet::storage {

// ISecurityEventLog is the append-only security journal.
// append() fills previous_hash / event_hash and returns the stored event.
class ISecurityEventLog {
 public:
  virtual ~ISecurityEventLog() = default;

  [[nodiscard]] virtual core::Result<SecurityEvent, std::string> append(
      const SecurityEvent& event) = 0;

  // Events of one chain in append order.
  [[nodiscard]] virtual std::vector<SecurityEvent> query(const std::string& task_id) const = 0;

  // Distinct chain keys (task ids, "" for untasked events).
  [[nodiscard]] virtual std::vector<std::string> list_task_ids() const = 0;

  [[nodiscard]] virtual std::size_t count() const = 0;

 protected:
  ISecurityEventLog() = default;
  ISecurityEventLog(const ISecurityEventLog&) = default;
  ISecurityEventLog& operator=(const ISecurityEventLog&) = default;
  ISecurityEventLog(ISecurityEventLog&&) = default;
  ISecurityEventLog& operator=(ISecurityEventLog&&) = default;
};

class InMemorySecurityEventLog final : public ISecurityEventLog {
 public:
  [[nodiscard]] core::Result<SecurityEvent, std::string> append(
      const SecurityEvent& event) override;
  [[nodiscard]] std::vector<SecurityEvent> query(const std::string& task_id) const override;
  [[nodiscard]] std::vector<std::string> list_task_ids() const override;
  [[nodiscard]] std::size_t count() const override;

  // Test hook: direct access to stored events for tamper tests.
  [[nodiscard]] std::vector<SecurityEvent>& mutable_events_for_testing() { return events_; }

 private:
  mutable std::mutex mutex_;
  std::vector<SecurityEvent> events_;
  // Per-chain last event_hash.
  std::map<std::string, std::string> last_hash_;
};

}  // namespace lancet::storage
