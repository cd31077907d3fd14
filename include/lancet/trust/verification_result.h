#pragma once

#include "lancet/trust/trust_level.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lancet::trust {

struct NliTally {
  int supporting{0};  // NOLINT(readability-identifier-naming)
  int refuting{0};    // NOLINT(readability-identifier-naming)
  int neutral{0};     // NOLINT(readability-identifier-naming)
};

struct VerificationDetails {
  int independent_sources{0};                     // NOLINT(readability-identifier-naming)
  std::vector<std::string> corroborating_claims;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> contradicting_claims;  // NOLINT(readability-identifier-naming)
  NliTally nli_scores;                            // NOLINT(readability-identifier-naming)
};

struct VerificationResult {
  std::string claim_id;                                               // NOLINT(readability-identifier-naming)
  std::string domain;                                                 // NOLINT(readability-identifier-naming)
  TrustLevel original_trust_level{TrustLevel::kUnverified};           // NOLINT(readability-identifier-naming)
  TrustLevel new_trust_level{TrustLevel::kUnverified};                // NOLINT(readability-identifier-naming)
  VerificationStatus verification_status{VerificationStatus::kPending};  // NOLINT(readability-identifier-naming)
  PromotionResult promotion_result{PromotionResult::kUnchanged};      // NOLINT(readability-identifier-naming)
  std::optional<ReasonCode> reason;                                   // NOLINT(readability-identifier-naming)
  VerificationDetails details;                                        // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const VerificationDetails& details);
[[nodiscard]] nlohmann::json to_json(const VerificationResult& result);

}  // namespace lancet::trust
