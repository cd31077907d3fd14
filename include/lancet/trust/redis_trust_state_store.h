#pragma once

#include "lancet/trust/redis_config.h"
#include "lancet/trust/trust_state_store.h"

#include <memory>
#include <string>

// Forward declare Redis++ types to avoid exposing them in header
namespace sw {
namespace redis {
class Redis;
}
}  // namespace sw

namespace lancet::trust {

// RedisTrustStateStore shares trust state between server processes.
//
// Redis data model (P = key prefix, default "lancet:trust"):
// - P:domain:{d}         hash: domain, trust_level, last_updated, is_blocked, blocked_at,
//                        block_reason, block_reason_code, block_cause_id,
//                        original_trust_level, n_<bucket> counters
// - P:domain:{d}:claims  hash: claim_id -> bucket name
// - P:domains            set of known domains
// - P:blocked            set of blocked domains
// - P:notify             list of queued notifications (JSON)
// - P:notify:domains     set of domains with a queued notification (dedup)
//
// Every mutation runs as one Lua script. Read-side calls are plain commands.
// Redis errors surface as exceptions derived from std::exception.
class RedisTrustStateStore final : public ITrustStateStore {
 public:
  // Throws std::runtime_error if the connection or script load fails.
  explicit RedisTrustStateStore(const RedisConfig& config,
                                std::string key_prefix = "lancet:trust");

  ~RedisTrustStateStore() override;

  RedisTrustStateStore(const RedisTrustStateStore&) = delete;
  RedisTrustStateStore& operator=(const RedisTrustStateStore&) = delete;
  RedisTrustStateStore(RedisTrustStateStore&&) = delete;
  RedisTrustStateStore& operator=(RedisTrustStateStore&&) = delete;

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
  [[nodiscard]] std::string domain_key(const std::string& domain) const;
  [[nodiscard]] std::string claims_key(const std::string& domain) const;
  [[nodiscard]] std::string key(const std::string& suffix) const;

  void load_scripts();

  std::unique_ptr<sw::redis::Redis> redis_;
  std::string prefix_;

  std::string apply_script_sha_;
  std::string block_script_sha_;
  std::string unblock_script_sha_;
  std::string drain_script_sha_;
};

}  // namespace lancet::trust
