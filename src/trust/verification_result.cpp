#include "lancet/trust/verification_result.h"

namespace lancet::trust {

nlohmann::json to_json(const VerificationDetails& details) {
  return nlohmann::json{{"independent_sources", details.independent_sources},
                        {"corroborating_claims", details.corroborating_claims},
                        {"contradicting_claims", details.contradicting_claims},
                        {"nli_scores",
                         {{"supporting", details.nli_scores.supporting},
                          {"refuting", details.nli_scores.refuting},
                          {"neutral", details.nli_scores.neutral}}}};
}

nlohmann::json to_json(const VerificationResult& result) {
  return nlohmann::json{
      {"claim_id", result.claim_id},
      {"domain", result.domain},
      {"original_trust_level", to_string(result.original_trust_level)},
      {"new_trust_level", to_string(result.new_trust_level)},
      {"verification_status", to_string(result.verification_status)},
      {"promotion_result", to_string(result.promotion_result)},
      {"reason", result.reason.has_value() ? nlohmann::json(to_string(*result.reason))
                                           : nlohmann::json(nullptr)},
      {"details", to_json(result.details)}};
}

}  // namespace lancet::trust
