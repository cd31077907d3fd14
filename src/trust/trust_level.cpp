#include "lancet/trust/trust_level.h"

namespace lancet::trust {

std::string to_string(const TrustLevel level) {
  switch (level) {
    case TrustLevel::kUnverified:
      return "unverified";
    case TrustLevel::kLow:
      return "low";
    case TrustLevel::kTrusted:
      return "trusted";
    case TrustLevel::kBlocked:
      return "blocked";
  }
  return "unverified";
}

std::string to_string(const VerificationStatus status) {
  switch (status) {
    case VerificationStatus::kPending:
      return "pending";
    case VerificationStatus::kVerified:
      return "verified";
    case VerificationStatus::kRejected:
      return "rejected";
  }
  return "pending";
}

std::string to_string(const PromotionResult result) {
  switch (result) {
    case PromotionResult::kPromoted:
      return "promoted";
    case PromotionResult::kDemoted:
      return "demoted";
    case PromotionResult::kUnchanged:
      return "unchanged";
  }
  return "unchanged";
}

std::string to_string(const ReasonCode code) {
  switch (code) {
    case ReasonCode::kConflictingEvidence:
      return "conflicting_evidence";
    case ReasonCode::kWellSupported:
      return "well_supported";
    case ReasonCode::kInsufficientEvidence:
      return "insufficient_evidence";
    case ReasonCode::kDangerousPattern:
      return "dangerous_pattern";
    case ReasonCode::kAlreadyBlocked:
      return "already_blocked";
    case ReasonCode::kHighRejectionRate:
      return "high_rejection_rate";
    case ReasonCode::kManualRejection:
      return "manual_rejection";
  }
  return "insufficient_evidence";
}

std::string to_string(const DomainBlockReason reason) {
  switch (reason) {
    case DomainBlockReason::kDangerousPattern:
      return "dangerous_pattern";
    case DomainBlockReason::kHighRejectionRate:
      return "high_rejection_rate";
    case DomainBlockReason::kDenylist:
      return "denylist";
    case DomainBlockReason::kManual:
      return "manual";
    case DomainBlockReason::kUnknown:
      return "unknown";
  }
  return "unknown";
}

std::string to_string(const ClaimBucket bucket) {
  switch (bucket) {
    case ClaimBucket::kVerified:
      return "verified";
    case ClaimBucket::kSecurityRejected:
      return "security_rejected";
    case ClaimBucket::kManualRejected:
      return "manual_rejected";
    case ClaimBucket::kPending:
      return "pending";
  }
  return "pending";
}

std::optional<TrustLevel> parse_trust_level(const std::string_view value) {
  for (const auto level :
       {TrustLevel::kUnverified, TrustLevel::kLow, TrustLevel::kTrusted, TrustLevel::kBlocked}) {
    if (to_string(level) == value) {
      return level;
    }
  }
  return std::nullopt;
}

std::optional<DomainBlockReason> parse_block_reason(const std::string_view value) {
  for (const auto reason :
       {DomainBlockReason::kDangerousPattern, DomainBlockReason::kHighRejectionRate,
        DomainBlockReason::kDenylist, DomainBlockReason::kManual, DomainBlockReason::kUnknown}) {
    if (to_string(reason) == value) {
      return reason;
    }
  }
  return std::nullopt;
}

std::optional<ClaimBucket> parse_claim_bucket(const std::string_view value) {
  for (const auto bucket : {ClaimBucket::kVerified, ClaimBucket::kSecurityRejected,
                            ClaimBucket::kManualRejected, ClaimBucket::kPending}) {
    if (to_string(bucket) == value) {
      return bucket;
    }
  }
  return std::nullopt;
}

std::string unblock_risk(const DomainBlockReason reason) {
  switch (reason) {
    case DomainBlockReason::kHighRejectionRate:
    case DomainBlockReason::kDenylist:
    case DomainBlockReason::kManual:
      return "low";
    case DomainBlockReason::kDangerousPattern:
    case DomainBlockReason::kUnknown:
      return "high";
  }
  return "high";
}

}  // namespace lancet::trust
