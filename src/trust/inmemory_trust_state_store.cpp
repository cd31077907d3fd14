#include "lancet/trust/inmemory_trust_state_store.h"

namespace lancet::trust {

DomainVerificationState& InMemoryTrustStateStore::state_for(const std::string& domain,
                                                            const TrustLevel baseline_trust) {
  auto it = states_.find(domain);
  if (it == states_.end()) {
    DomainVerificationState state;
    state.domain = domain;
    state.trust_level = baseline_trust;
    it = states_.emplace(domain, std::move(state)).first;
  }
  return it->second;
}

void InMemoryTrustStateStore::mark_blocked(DomainVerificationState& state,
                                           const BlockRequest& request,
                                           const std::string& updated_at) {
  state.original_trust_level = state.trust_level;
  state.trust_level = TrustLevel::kBlocked;
  state.is_blocked = true;
  state.blocked_at = updated_at;
  state.block_reason = request.reason;
  state.block_reason_code = request.code;
  state.block_cause_id = request.cause_id;
  state.last_updated = updated_at;
  blocked_.insert(state.domain);
}

bool InMemoryTrustStateStore::enqueue(BlockedDomainNotification notification) {
  for (const auto& queued : queue_) {
    if (queued.domain == notification.domain) {
      return false;
    }
  }
  queue_.push_back(std::move(notification));
  return true;
}

TransitionApplied InMemoryTrustStateStore::apply_claim_transition(
    const ClaimTransition& transition) {
  std::lock_guard<std::mutex> lock(mutex_);

  DomainVerificationState& state = state_for(transition.domain, transition.baseline_trust);

  TransitionApplied applied;
  applied.before = state.trust_level;
  if (state.is_blocked) {
    applied.rejected_as_blocked = true;
    applied.after = TrustLevel::kBlocked;
    applied.rejection_rate = state.rejection_rate();
    return applied;
  }

  state.place(transition.claim_id, transition.bucket);
  state.last_updated = transition.updated_at;
  applied.rejection_rate = state.rejection_rate();

  if (transition.block.has_value()) {
    mark_blocked(state, *transition.block, transition.updated_at);
    applied.notification_queued =
        enqueue({transition.domain, transition.block->reason, transition.block->task_id,
                 transition.block->cause_id});
    applied.after = TrustLevel::kBlocked;
    return applied;
  }

  if (transition.promote_if_unverified && state.trust_level == TrustLevel::kUnverified) {
    state.trust_level = TrustLevel::kLow;
  }

  const bool rejection = transition.bucket == ClaimBucket::kSecurityRejected ||
                         transition.bucket == ClaimBucket::kManualRejected;
  if (rejection && may_auto_block(applied.before) && state.total_claims() > 0 &&
      applied.rejection_rate > transition.max_rejection_rate) {
    BlockRequest request;
    request.code = DomainBlockReason::kHighRejectionRate;
    request.reason = format_rejection_reason(applied.rejection_rate);
    request.cause_id = transition.cause_id;
    mark_blocked(state, request, transition.updated_at);
    applied.auto_blocked = true;
    applied.notification_queued =
        enqueue({transition.domain, request.reason, "", transition.cause_id});
  }

  applied.after = state.trust_level;
  return applied;
}

bool InMemoryTrustStateStore::block_domain(const std::string& domain, const BlockRequest& request,
                                           const TrustLevel baseline_trust,
                                           const std::string& updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  DomainVerificationState& state = state_for(domain, baseline_trust);
  if (state.is_blocked) {
    return false;
  }
  mark_blocked(state, request, updated_at);
  enqueue({domain, request.reason, request.task_id, request.cause_id});
  return true;
}

std::optional<TrustLevel> InMemoryTrustStateStore::unblock_domain(const std::string& domain,
                                                                  const std::string& updated_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (blocked_.erase(domain) == 0) {
    return std::nullopt;
  }

  TrustLevel restored = TrustLevel::kUnverified;
  const auto it = states_.find(domain);
  if (it != states_.end()) {
    DomainVerificationState& state = it->second;
    restored = state.original_trust_level.value_or(TrustLevel::kUnverified);
    state.trust_level = restored;
    state.is_blocked = false;
    state.last_updated = updated_at;
  }
  return restored;
}

bool InMemoryTrustStateStore::is_blocked(const std::string& domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocked_.count(domain) > 0;
}

std::optional<DomainVerificationState> InMemoryTrustStateStore::get_domain_state(
    const std::string& domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = states_.find(domain);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<DomainVerificationState> InMemoryTrustStateStore::all_domain_states() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DomainVerificationState> out;
  out.reserve(states_.size());
  for (const auto& [_, state] : states_) {
    out.push_back(state);
  }
  return out;
}

std::vector<std::string> InMemoryTrustStateStore::blocked_domains() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {blocked_.begin(), blocked_.end()};
}

std::vector<BlockedDomainNotification> InMemoryTrustStateStore::drain_notifications() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<BlockedDomainNotification> out;
  out.swap(queue_);
  return out;
}

std::size_t InMemoryTrustStateStore::pending_notification_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void InMemoryTrustStateStore::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  states_.clear();
  blocked_.clear();
  queue_.clear();
}

}  // namespace lancet::trust
