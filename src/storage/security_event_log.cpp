#include "lancet/storage/security_event_log.h"

#include "lancet/storage/event_chain.h"

namespace lancet::storage {

core::Result<SecurityEvent, std::string> InMemorySecurityEventLog::append(
    const SecurityEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  const auto it = last_hash_.find(event.task_id);
  const std::string prev = (it != last_hash_.end()) ? it->second : std::string(kGenesisHash);

  SecurityEvent stored = event;
  stored.previous_hash = prev;
  stored.event_hash = compute_event_hash(event, prev);

  last_hash_[event.task_id] = stored.event_hash;
  events_.push_back(stored);
  return core::Result<SecurityEvent, std::string>::ok(std::move(stored));
}

std::vector<SecurityEvent> InMemorySecurityEventLog::query(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SecurityEvent> filtered;
  for (const auto& event : events_) {
    if (event.task_id == task_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

std::vector<std::string> InMemorySecurityEventLog::list_task_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(last_hash_.size());
  for (const auto& [k, _] : last_hash_) {
    ids.push_back(k);
  }
  return ids;
}

std::size_t InMemorySecurityEventLog::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace lancet::storage
