#pragma once

#include "lancet/trust/trust_state_store.h"

#include <map>
#include <mutex>
#include <set>

namespace lancet::trust {

// InMemoryTrustStateStore serializes every call on one mutex.
class InMemoryTrustStateStore final : public ITrustStateStore {
 public:
  InMemoryTrustStateStore() = default;

  TransitionApplied apply_claim_transition(const ClaimTransition& transition) override;
  bool block_domain(const std::string& domain, const BlockRequest& request,
                    TrustLevel baseline_trust, const std::string& updated_at) override;
  std::optional<TrustLevel> unblock_domain(const std::string& domain,
                                           const std::string& updated_at) override;

  [[nodiscard]] bool is_blocked(const std::string& domain) const override;
  [[nodiscard]] std::optional<DomainVerificationState> get_domain_state(
      const std::string& domain) const override;
  [[nodiscard]] std::vector<DomainVerificationState> all_domain_states() const override;
  [[nodiscard]] std::vector<std::string> blocked_domains() const override;

  std::vector<BlockedDomainNotification> drain_notifications() override;
  [[nodiscard]] std::size_t pending_notification_count() const override;

  void reset() override;

 private:
  DomainVerificationState& state_for(const std::string& domain, TrustLevel baseline_trust);
  void mark_blocked(DomainVerificationState& state, const BlockRequest& request,
                    const std::string& updated_at);
  bool enqueue(BlockedDomainNotification notification);

  mutable std::mutex mutex_;
  std::map<std::string, DomainVerificationState> states_;
  std::set<std::string> blocked_;
  std::vector<BlockedDomainNotification> queue_;
};

}  // namespace lancet::trust
