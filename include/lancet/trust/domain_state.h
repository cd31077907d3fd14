#pragma once

#include "lancet/trust/trust_level.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <set>
#include <string>

namespace lancet::trust {

// DomainVerificationState tracks one domain across claims. A claim id is in exactly one of the
// four bucket sets.
struct DomainVerificationState {
  std::string domain;                                 // NOLINT(readability-identifier-naming)
  TrustLevel trust_level{TrustLevel::kUnverified};    // NOLINT(readability-identifier-naming)
  std::set<std::string> verified_claims;              // NOLINT(readability-identifier-naming)
  std::set<std::string> security_rejected_claims;     // NOLINT(readability-identifier-naming)
  std::set<std::string> manual_rejected_claims;       // NOLINT(readability-identifier-naming)
  std::set<std::string> pending_claims;               // NOLINT(readability-identifier-naming)
  std::string last_updated;                           // NOLINT(readability-identifier-naming)

  bool is_blocked{false};                             // NOLINT(readability-identifier-naming)
  std::string blocked_at;                             // NOLINT(readability-identifier-naming)
  std::string block_reason;                           // NOLINT(readability-identifier-naming)
  std::optional<DomainBlockReason> block_reason_code; // NOLINT(readability-identifier-naming)
  std::string block_cause_id;                         // NOLINT(readability-identifier-naming)
  std::optional<TrustLevel> original_trust_level;     // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::size_t total_claims() const {
    return verified_claims.size() + rejected_claims() + pending_claims.size();
  }
  [[nodiscard]] std::size_t rejected_claims() const {
    return security_rejected_claims.size() + manual_rejected_claims.size();
  }
  // Combined rejection rate; 0 when the domain has no claims.
  [[nodiscard]] double rejection_rate() const;
  [[nodiscard]] double verification_rate() const;

  // bucket_of returns the bucket holding claim_id, if any.
  [[nodiscard]] std::optional<ClaimBucket> bucket_of(const std::string& claim_id) const;

  // place moves claim_id into bucket, removing it from every other bucket.
  void place(const std::string& claim_id, ClaimBucket bucket);
};

[[nodiscard]] nlohmann::json to_json(const DomainVerificationState& state);

}  // namespace lancet::trust
