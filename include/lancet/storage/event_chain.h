#pragma once

#include "lancet/storage/security_event.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::storage {

class ISecurityEventLog;

// Genesis hash used as previous_hash for the first event of each chain.
inline constexpr std::string_view kGenesisHash =
    "0000000000000000000000000000000000000000000000000000000000000000";

// compute_event_hash returns SHA-256 (hex) over the sorted-key JSON of the event's content
// fields (created_at, details, event_id, event_type, severity, task_id) concatenated with
// previous_hash. Pure.
[[nodiscard]] std::string compute_event_hash(const SecurityEvent& event,
                                             const std::string& previous_hash);

struct ChainVerificationResult {
  bool valid{false};                  // NOLINT(readability-identifier-naming)
  std::size_t first_invalid_index{};  // NOLINT(readability-identifier-naming)
  std::string error;                  // NOLINT(readability-identifier-naming)
};

// verify_event_chain checks one chain in append order.
//   valid == true,  first_invalid_index == events.size()  chain intact
//   valid == false, first_invalid_index == N              event N is corrupt or out of order
[[nodiscard]] ChainVerificationResult verify_event_chain(const std::vector<SecurityEvent>& events);

struct ChainFailure {
  std::string task_id;              // NOLINT(readability-identifier-naming)
  ChainVerificationResult result;   // NOLINT(readability-identifier-naming)
};

// verify_all_chains verifies every chain in log and returns the broken ones.
[[nodiscard]] std::vector<ChainFailure> verify_all_chains(const ISecurityEventLog& log);

}  // namespace lancet::storage
