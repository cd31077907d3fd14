#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lancet::trust {

// TrustLevel of a source domain. UNVERIFIED -> LOW by corroboration; TRUSTED is only ever
// assigned by the policy store; BLOCKED is terminal until an explicit unblock.
enum class TrustLevel {
  kUnverified,
  kLow,
  kTrusted,
  kBlocked,
};

enum class VerificationStatus {
  kPending,
  kVerified,
  kRejected,
};

enum class PromotionResult {
  kPromoted,
  kDemoted,
  kUnchanged,
};

// ReasonCode states the evidence fact behind a verification outcome.
enum class ReasonCode {
  kConflictingEvidence,
  kWellSupported,
  kInsufficientEvidence,
  kDangerousPattern,
  kAlreadyBlocked,
  kHighRejectionRate,
  kManualRejection,
};

// DomainBlockReason records why a domain was blocked; it drives the unblock risk shown to
// operators.
enum class DomainBlockReason {
  kDangerousPattern,
  kHighRejectionRate,
  kDenylist,
  kManual,
  kUnknown,
};

// ClaimBucket is the one bucket a claim id occupies within its domain.
enum class ClaimBucket {
  kVerified,
  kSecurityRejected,
  kManualRejected,
  kPending,
};

[[nodiscard]] std::string to_string(TrustLevel level);
[[nodiscard]] std::string to_string(VerificationStatus status);
[[nodiscard]] std::string to_string(PromotionResult result);
[[nodiscard]] std::string to_string(ReasonCode code);
[[nodiscard]] std::string to_string(DomainBlockReason reason);
[[nodiscard]] std::string to_string(ClaimBucket bucket);

[[nodiscard]] std::optional<TrustLevel> parse_trust_level(std::string_view value);
[[nodiscard]] std::optional<DomainBlockReason> parse_block_reason(std::string_view value);
[[nodiscard]] std::optional<ClaimBucket> parse_claim_bucket(std::string_view value);

// unblock_risk returns "high" for dangerous_pattern and unknown blocks, "low" otherwise.
[[nodiscard]] std::string unblock_risk(DomainBlockReason reason);

// may_auto_block reports whether the rejection-rate rule applies at this level.
[[nodiscard]] constexpr bool may_auto_block(const TrustLevel level) {
  return level == TrustLevel::kUnverified || level == TrustLevel::kLow;
}

}  // namespace lancet::trust
