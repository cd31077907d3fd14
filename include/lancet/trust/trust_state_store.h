#pragma once

#include "lancet/trust/domain_state.h"
#include "lancet/trust/notifier.h"
#include "lancet/trust/trust_level.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace lancet::trust {

// BlockRequest describes a block to record together with a claim transition or on its own.
struct BlockRequest {
  DomainBlockReason code{DomainBlockReason::kUnknown};  // NOLINT(readability-identifier-naming)
  std::string reason;                                   // NOLINT(readability-identifier-naming)
  std::string cause_id;                                 // NOLINT(readability-identifier-naming)
  std::string task_id;                                  // NOLINT(readability-identifier-naming)
};

// ClaimTransition is one atomic update of a domain's claim buckets.
struct ClaimTransition {
  std::string domain;                                // NOLINT(readability-identifier-naming)
  std::string claim_id;                              // NOLINT(readability-identifier-naming)
  ClaimBucket bucket{ClaimBucket::kPending};         // NOLINT(readability-identifier-naming)
  // Trust level given to the domain state if this call creates it.
  TrustLevel baseline_trust{TrustLevel::kUnverified};  // NOLINT(readability-identifier-naming)
  // UNVERIFIED -> LOW after the bucket update.
  bool promote_if_unverified{false};                 // NOLINT(readability-identifier-naming)
  // Block the domain in the same critical section.
  std::optional<BlockRequest> block;                 // NOLINT(readability-identifier-naming)
  // Auto-block threshold, checked after placing a claim into a rejection bucket.
  double max_rejection_rate{0.3};                    // NOLINT(readability-identifier-naming)
  // Event that triggered the claim; recorded on an auto-block and its notification.
  std::string cause_id;                              // NOLINT(readability-identifier-naming)
  std::string updated_at;                            // NOLINT(readability-identifier-naming)
};

struct TransitionApplied {
  // The domain was already blocked; no bucket was changed.
  bool rejected_as_blocked{false};                 // NOLINT(readability-identifier-naming)
  TrustLevel before{TrustLevel::kUnverified};      // NOLINT(readability-identifier-naming)
  TrustLevel after{TrustLevel::kUnverified};       // NOLINT(readability-identifier-naming)
  bool auto_blocked{false};                        // NOLINT(readability-identifier-naming)
  double rejection_rate{0.0};                      // NOLINT(readability-identifier-naming)
  bool notification_queued{false};                 // NOLINT(readability-identifier-naming)
};

// ITrustStateStore holds per-domain verification state, the blocked-domain set and the pending
// blocked-domain notification queue. Each mutating call is one critical section.
//
// Notification queueing is deduplicated by domain: a domain with a queued notification is not
// queued again until the queue is drained.
class ITrustStateStore {
 public:
  virtual ~ITrustStateStore() = default;

  virtual TransitionApplied apply_claim_transition(const ClaimTransition& transition) = 0;

  // block_domain blocks domain and queues a notification. Returns false when it was already
  // blocked; the existing block record is kept.
  virtual bool block_domain(const std::string& domain, const BlockRequest& request,
                            TrustLevel baseline_trust, const std::string& updated_at) = 0;

  // unblock_domain clears the block and restores the pre-block trust level, which it returns.
  // nullopt when the domain was not blocked.
  virtual std::optional<TrustLevel> unblock_domain(const std::string& domain,
                                                   const std::string& updated_at) = 0;

  [[nodiscard]] virtual bool is_blocked(const std::string& domain) const = 0;
  [[nodiscard]] virtual std::optional<DomainVerificationState> get_domain_state(
      const std::string& domain) const = 0;
  [[nodiscard]] virtual std::vector<DomainVerificationState> all_domain_states() const = 0;
  [[nodiscard]] virtual std::vector<std::string> blocked_domains() const = 0;

  // drain_notifications returns the queued notifications in queue order and empties the queue.
  virtual std::vector<BlockedDomainNotification> drain_notifications() = 0;
  [[nodiscard]] virtual std::size_t pending_notification_count() const = 0;

  virtual void reset() = 0;

 protected:
  ITrustStateStore() = default;
  ITrustStateStore(const ITrustStateStore&) = default;
  ITrustStateStore& operator=(const ITrustStateStore&) = default;
  ITrustStateStore(ITrustStateStore&&) = default;
  ITrustStateStore& operator=(ITrustStateStore&&) = default;
};

// format_rejection_reason renders the human-readable auto-block reason, e.g.
// "High rejection rate (43%)".
[[nodiscard]] std::string format_rejection_reason(double rate);

}  // namespace lancet::trust
