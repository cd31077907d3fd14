#pragma once

#include "lancet/core/clock.h"
#include "lancet/core/security_config.h"
#include "lancet/logging/logger.h"
#include "lancet/response/response_meta.h"
#include "lancet/trust/domain_policy_store.h"
#include "lancet/trust/evidence_source.h"
#include "lancet/trust/notifier.h"
#include "lancet/trust/trust_state_store.h"
#include "lancet/trust/verification_result.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace lancet::trust {

struct SourceVerifierOptions {
  int min_independent_sources{core::kMinIndependentSourcesForPromotion};  // NOLINT(readability-identifier-naming)
  double max_rejection_rate{core::kMaxRejectionRateBeforeBlock};          // NOLINT(readability-identifier-naming)
};

// BlockedDomainInfo is the operator view of one blocked domain (get_status).
struct BlockedDomainInfo {
  std::string domain;                               // NOLINT(readability-identifier-naming)
  std::string blocked_at;                           // NOLINT(readability-identifier-naming)
  std::string reason;                               // NOLINT(readability-identifier-naming)
  std::string cause_id;                             // NOLINT(readability-identifier-naming)
  std::optional<TrustLevel> original_trust_level;   // NOLINT(readability-identifier-naming)
  DomainBlockReason domain_block_reason{DomainBlockReason::kUnknown};  // NOLINT(readability-identifier-naming)
  bool can_restore{false};                          // NOLINT(readability-identifier-naming)
};

inline constexpr const char* kRestoreVia = "feedback(domain_unblock)";

[[nodiscard]] nlohmann::json to_json(const BlockedDomainInfo& info);

struct NotificationOutcome {
  BlockedDomainNotification notification;  // NOLINT(readability-identifier-naming)
  bool delivered{false};                   // NOLINT(readability-identifier-naming)
  nlohmann::json receipt;                  // NOLINT(readability-identifier-naming)
  std::string error;                       // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const NotificationOutcome& outcome);

// SourceVerifier runs the domain trust state machine:
//
//   UNVERIFIED --(2+ independent sources)--> LOW
//   any        --(dangerous pattern | manual block | rejection rate)--> BLOCKED
//   BLOCKED    --(unblock)--> level held before the block
//
// TRUSTED only comes from the policy store. Conflicting evidence never demotes.
// State lives in an ITrustStateStore; every bucket update is one atomic store call, so
// concurrent verify_claim calls on one claim leave it in exactly one bucket.
class SourceVerifier {
 public:
  SourceVerifier(ITrustStateStore& store, const IDomainPolicyStore& policy, core::IClock& clock,
                 logging::Logger logger, SourceVerifierOptions options = {});

  // verify_claim classifies one claim from domain. Exceptions thrown by evidence propagate.
  VerificationResult verify_claim(const std::string& claim_id, const std::string& domain,
                                  IEvidenceSource& evidence, bool has_dangerous_pattern = false,
                                  const std::string& cause_id = "");

  // reject_claim records a human rejection; it can trip the rejection-rate auto-block.
  VerificationResult reject_claim(const std::string& claim_id, const std::string& domain,
                                  const std::string& reason, const std::string& cause_id = "");

  // Returns false when the domain was already blocked.
  bool block_domain_manual(const std::string& domain, const std::string& reason,
                           const std::string& cause_id = "");

  // Returns false when the domain was not blocked in this store.
  bool unblock_domain(const std::string& domain);

  [[nodiscard]] bool is_domain_blocked(const std::string& domain) const;
  [[nodiscard]] std::vector<BlockedDomainInfo> get_blocked_domains_info() const;
  [[nodiscard]] std::optional<DomainVerificationState> get_domain_state(
      const std::string& domain) const;
  [[nodiscard]] std::vector<DomainVerificationState> get_all_domain_states() const;
  [[nodiscard]] std::size_t get_pending_notification_count() const;

  // send_pending_notifications drains the queue now, then delivers on another thread.
  // task_id, when given, overrides the queued task id. Each failed delivery is logged and
  // reported in its outcome; nothing is re-queued. notifier must outlive the future.
  std::future<std::vector<NotificationOutcome>> send_pending_notifications(
      INotifier& notifier, const std::optional<std::string>& task_id = std::nullopt);

  [[nodiscard]] response::ResponseMetaBuilder build_response_meta(
      const std::vector<VerificationResult>& results) const;

  void reset();

 private:
  [[nodiscard]] TrustLevel baseline_for(const std::string& domain) const;
  [[nodiscard]] TrustLevel current_level(const std::string& domain) const;
  [[nodiscard]] bool blocked_anywhere(const std::string& domain) const;
  [[nodiscard]] VerificationResult already_blocked(const std::string& claim_id,
                                                   const std::string& domain,
                                                   TrustLevel original,
                                                   VerificationDetails details = {}) const;

  ITrustStateStore* store_;
  const IDomainPolicyStore* policy_;
  core::IClock* clock_;
  logging::Logger logger_;
  SourceVerifierOptions options_;
};

}  // namespace lancet::trust
