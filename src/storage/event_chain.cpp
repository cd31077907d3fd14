#include "lancet/storage/event_chain.h"

#include "lancet/core/sha256.h"
#include "lancet/storage/security_event_log.h"

#include <nlohmann/json.hpp>

namespace lancet::storage {

std::string compute_event_hash(const SecurityEvent& event, const std::string& previous_hash) {
  // nlohmann::json objects keep keys sorted, so dump() is stable for equal content.
  nlohmann::json j;
  j["created_at"] = event.created_at;
  j["details"] = event.details;
  j["event_id"] = event.event_id;
  j["event_type"] = to_string(event.event_type);
  j["severity"] = to_string(event.severity);
  j["task_id"] = event.task_id;

  return core::sha256_hex(j.dump() + previous_hash);
}

ChainVerificationResult verify_event_chain(const std::vector<SecurityEvent>& events) {
  std::string expected_previous = std::string(kGenesisHash);

  for (std::size_t i = 0; i < events.size(); ++i) {
    const SecurityEvent& ev = events[i];

    if (ev.previous_hash != expected_previous) {
      return {false, i, "previous_hash mismatch at index " + std::to_string(i)};
    }
    if (ev.event_hash != compute_event_hash(ev, ev.previous_hash)) {
      return {false, i, "event_hash mismatch at index " + std::to_string(i)};
    }
    expected_previous = ev.event_hash;
  }

  return {true, events.size(), ""};
}

std::vector<ChainFailure> verify_all_chains(const ISecurityEventLog& log) {
  std::vector<ChainFailure> failures;
  for (const auto& task_id : log.list_task_ids()) {
    auto result = verify_event_chain(log.query(task_id));
    if (!result.valid) {
      failures.push_back({task_id, std::move(result)});
    }
  }
  return failures;
}

}  // namespace lancet::storage
