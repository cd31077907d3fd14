#include "lancet/trust/domain_state.h"

namespace lancet::trust {

double DomainVerificationState::rejection_rate() const {
  const std::size_t total = total_claims();
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(rejected_claims()) / static_cast<double>(total);
}

double DomainVerificationState::verification_rate() const {
  const std::size_t total = total_claims();
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(verified_claims.size()) / static_cast<double>(total);
}

std::optional<ClaimBucket> DomainVerificationState::bucket_of(const std::string& claim_id) const {
  if (verified_claims.count(claim_id) > 0) {
    return ClaimBucket::kVerified;
  }
  if (security_rejected_claims.count(claim_id) > 0) {
    return ClaimBucket::kSecurityRejected;
  }
  if (manual_rejected_claims.count(claim_id) > 0) {
    return ClaimBucket::kManualRejected;
  }
  if (pending_claims.count(claim_id) > 0) {
    return ClaimBucket::kPending;
  }
  return std::nullopt;
}

void DomainVerificationState::place(const std::string& claim_id, const ClaimBucket bucket) {
  verified_claims.erase(claim_id);
  security_rejected_claims.erase(claim_id);
  manual_rejected_claims.erase(claim_id);
  pending_claims.erase(claim_id);

  switch (bucket) {
    case ClaimBucket::kVerified:
      verified_claims.insert(claim_id);
      break;
    case ClaimBucket::kSecurityRejected:
      security_rejected_claims.insert(claim_id);
      break;
    case ClaimBucket::kManualRejected:
      manual_rejected_claims.insert(claim_id);
      break;
    case ClaimBucket::kPending:
      pending_claims.insert(claim_id);
      break;
  }
}

nlohmann::json to_json(const DomainVerificationState& state) {
  nlohmann::json j{{"domain", state.domain},
                   {"trust_level", to_string(state.trust_level)},
                   {"verified_claims", state.verified_claims},
                   {"security_rejected_claims", state.security_rejected_claims},
                   {"manual_rejected_claims", state.manual_rejected_claims},
                   {"pending_claims", state.pending_claims},
                   {"total_claims", state.total_claims()},
                   {"rejection_rate", state.rejection_rate()},
                   {"verification_rate", state.verification_rate()},
                   {"last_updated", state.last_updated},
                   {"is_blocked", state.is_blocked}};
  if (state.is_blocked) {
    j["blocked_at"] = state.blocked_at;
    j["block_reason"] = state.block_reason;
    j["block_reason_code"] =
        to_string(state.block_reason_code.value_or(DomainBlockReason::kUnknown));
    j["block_cause_id"] = state.block_cause_id;
  }
  if (state.original_trust_level.has_value()) {
    j["original_trust_level"] = to_string(*state.original_trust_level);
  }
  return j;
}

}  // namespace lancet::trust
