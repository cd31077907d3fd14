#include "lancet/trust/source_verifier.h"

#include <algorithm>
#include <exception>
#include <utility>

namespace lancet::trust {

namespace {

constexpr const char* kDangerousPatternReason = "Dangerous pattern detected";

VerificationDetails details_from(const std::string& claim_id, const ClaimConfidence& confidence,
                                 const std::vector<Contradiction>& contradictions) {
  VerificationDetails details;
  details.independent_sources = confidence.independent_sources;
  details.nli_scores = {confidence.supporting_count, confidence.refuting_count,
                        confidence.neutral_count};
  for (const auto& c : contradictions) {
    const std::string* other = nullptr;
    if (c.claim1_id == claim_id) {
      other = &c.claim2_id;
    } else if (c.claim2_id == claim_id) {
      other = &c.claim1_id;
    }
    if (other != nullptr && std::find(details.contradicting_claims.begin(),
                                      details.contradicting_claims.end(),
                                      *other) == details.contradicting_claims.end()) {
      details.contradicting_claims.push_back(*other);
    }
  }
  return details;
}

}  // namespace

nlohmann::json to_json(const BlockedDomainInfo& info) {
  const auto code = info.domain_block_reason;
  return nlohmann::json{
      {"domain", info.domain},
      {"blocked_at", info.blocked_at.empty() ? nlohmann::json(nullptr)
                                             : nlohmann::json(info.blocked_at)},
      {"reason", info.reason},
      {"cause_id", info.cause_id.empty() ? nlohmann::json(nullptr)
                                         : nlohmann::json(info.cause_id)},
      {"original_trust_level", info.original_trust_level.has_value()
                                   ? nlohmann::json(to_string(*info.original_trust_level))
                                   : nlohmann::json(nullptr)},
      {"can_restore", info.can_restore},
      {"restore_via", kRestoreVia},
      {"domain_block_reason", to_string(code)},
      {"domain_unblock_risk", unblock_risk(code)}};
}

nlohmann::json to_json(const NotificationOutcome& outcome) {
  nlohmann::json j = to_json(outcome.notification);
  j["delivered"] = outcome.delivered;
  if (outcome.delivered) {
    j["receipt"] = outcome.receipt;
  } else {
    j["error"] = outcome.error;
  }
  return j;
}

SourceVerifier::SourceVerifier(ITrustStateStore& store, const IDomainPolicyStore& policy,
                               core::IClock& clock, logging::Logger logger,
                               SourceVerifierOptions options)
    : store_(&store),
      policy_(&policy),
      clock_(&clock),
      logger_(std::move(logger)),
      options_(options) {}

TrustLevel SourceVerifier::baseline_for(const std::string& domain) const {
  return policy_->get_domain_trust_level(domain).value_or(TrustLevel::kUnverified);
}

TrustLevel SourceVerifier::current_level(const std::string& domain) const {
  if (const auto state = store_->get_domain_state(domain)) {
    return state->trust_level;
  }
  return baseline_for(domain);
}

bool SourceVerifier::blocked_anywhere(const std::string& domain) const {
  return baseline_for(domain) == TrustLevel::kBlocked || store_->is_blocked(domain);
}

VerificationResult SourceVerifier::already_blocked(const std::string& claim_id,
                                                   const std::string& domain,
                                                   const TrustLevel original,
                                                   VerificationDetails details) const {
  VerificationResult result;
  result.claim_id = claim_id;
  result.domain = domain;
  result.original_trust_level = original;
  result.new_trust_level = TrustLevel::kBlocked;
  result.verification_status = VerificationStatus::kRejected;
  result.promotion_result = PromotionResult::kUnchanged;
  result.reason = ReasonCode::kAlreadyBlocked;
  result.details = std::move(details);
  return result;
}

VerificationResult SourceVerifier::verify_claim(const std::string& claim_id,
                                                const std::string& raw_domain,
                                                IEvidenceSource& evidence,
                                                const bool has_dangerous_pattern,
                                                const std::string& cause_id) {
  const std::string domain = normalize_domain(raw_domain);
  const TrustLevel baseline = baseline_for(domain);

  if (blocked_anywhere(domain)) {
    return already_blocked(claim_id, domain, current_level(domain));
  }

  ClaimTransition transition;
  transition.domain = domain;
  transition.claim_id = claim_id;
  transition.baseline_trust = baseline;
  transition.max_rejection_rate = options_.max_rejection_rate;
  transition.updated_at = clock_->now_iso8601();
  transition.cause_id = cause_id;

  if (has_dangerous_pattern) {
    transition.bucket = ClaimBucket::kSecurityRejected;
    transition.block = BlockRequest{DomainBlockReason::kDangerousPattern, kDangerousPatternReason,
                                    cause_id, ""};
    const TransitionApplied applied = store_->apply_claim_transition(transition);
    if (applied.rejected_as_blocked) {
      return already_blocked(claim_id, domain, applied.before);
    }

    logger_.warning("domain_blocked",
                    {{"domain", domain},
                     {"claim_id", claim_id},
                     {"block_reason", to_string(DomainBlockReason::kDangerousPattern)},
                     {"cause_id", cause_id},
                     {"notification_queued", applied.notification_queued}});

    VerificationResult result;
    result.claim_id = claim_id;
    result.domain = domain;
    result.original_trust_level = applied.before;
    result.new_trust_level = TrustLevel::kBlocked;
    result.verification_status = VerificationStatus::kRejected;
    result.promotion_result = PromotionResult::kDemoted;
    result.reason = ReasonCode::kDangerousPattern;
    return result;
  }

  // Evidence is queried outside any store critical section; the blocked state is re-checked
  // inside the atomic update below.
  const ClaimConfidence confidence = evidence.calculate_claim_confidence(claim_id);
  const std::vector<Contradiction> contradictions = evidence.find_contradictions();
  VerificationDetails details = details_from(claim_id, confidence, contradictions);

  VerificationStatus status = VerificationStatus::kPending;
  ReasonCode reason = ReasonCode::kInsufficientEvidence;
  if (!details.contradicting_claims.empty() || confidence.refuting_count > 0) {
    reason = ReasonCode::kConflictingEvidence;
  } else if (confidence.independent_sources >= options_.min_independent_sources) {
    status = VerificationStatus::kVerified;
    reason = ReasonCode::kWellSupported;
  }

  transition.bucket =
      status == VerificationStatus::kVerified ? ClaimBucket::kVerified : ClaimBucket::kPending;
  transition.promote_if_unverified = status == VerificationStatus::kVerified;

  const TransitionApplied applied = store_->apply_claim_transition(transition);
  if (applied.rejected_as_blocked) {
    return already_blocked(claim_id, domain, applied.before, std::move(details));
  }

  VerificationResult result;
  result.claim_id = claim_id;
  result.domain = domain;
  result.original_trust_level = applied.before;
  result.new_trust_level = applied.after;
  result.verification_status = status;
  result.promotion_result =
      (applied.before == TrustLevel::kUnverified && applied.after == TrustLevel::kLow)
          ? PromotionResult::kPromoted
          : PromotionResult::kUnchanged;
  result.reason = reason;
  result.details = std::move(details);

  if (result.promotion_result == PromotionResult::kPromoted) {
    logger_.info("domain_promoted", {{"domain", domain},
                                     {"claim_id", claim_id},
                                     {"independent_sources", confidence.independent_sources}});
  }
  return result;
}

VerificationResult SourceVerifier::reject_claim(const std::string& claim_id,
                                                const std::string& raw_domain,
                                                const std::string& reason,
                                                const std::string& cause_id) {
  const std::string domain = normalize_domain(raw_domain);
  if (blocked_anywhere(domain)) {
    return already_blocked(claim_id, domain, current_level(domain));
  }

  ClaimTransition transition;
  transition.domain = domain;
  transition.claim_id = claim_id;
  transition.bucket = ClaimBucket::kManualRejected;
  transition.baseline_trust = baseline_for(domain);
  transition.max_rejection_rate = options_.max_rejection_rate;
  transition.updated_at = clock_->now_iso8601();
  transition.cause_id = cause_id;

  const TransitionApplied applied = store_->apply_claim_transition(transition);
  if (applied.rejected_as_blocked) {
    return already_blocked(claim_id, domain, applied.before);
  }

  logger_.info("claim_rejected",
               {{"domain", domain}, {"claim_id", claim_id}, {"reason", reason}});

  VerificationResult result;
  result.claim_id = claim_id;
  result.domain = domain;
  result.original_trust_level = applied.before;
  result.new_trust_level = applied.after;
  result.verification_status = VerificationStatus::kRejected;
  result.promotion_result = PromotionResult::kUnchanged;
  result.reason = ReasonCode::kManualRejection;

  if (applied.auto_blocked) {
    result.promotion_result = PromotionResult::kDemoted;
    result.reason = ReasonCode::kHighRejectionRate;
    logger_.warning("domain_blocked",
                    {{"domain", domain},
                     {"block_reason", to_string(DomainBlockReason::kHighRejectionRate)},
                     {"rejection_rate", applied.rejection_rate},
                     {"cause_id", cause_id},
                     {"notification_queued", applied.notification_queued}});
  }
  return result;
}

bool SourceVerifier::block_domain_manual(const std::string& raw_domain, const std::string& reason,
                                         const std::string& cause_id) {
  const std::string domain = normalize_domain(raw_domain);
  const bool blocked = store_->block_domain(
      domain, BlockRequest{DomainBlockReason::kManual, reason, cause_id, ""}, baseline_for(domain),
      clock_->now_iso8601());
  logger_.info("domain_blocked_manual",
               {{"domain", domain}, {"reason", reason}, {"newly_blocked", blocked}});
  return blocked;
}

bool SourceVerifier::unblock_domain(const std::string& raw_domain) {
  const std::string domain = normalize_domain(raw_domain);
  const auto restored = store_->unblock_domain(domain, clock_->now_iso8601());
  if (!restored.has_value()) {
    return false;
  }
  logger_.info("domain_unblocked", {{"domain", domain}, {"restored_level", to_string(*restored)}});
  return true;
}

bool SourceVerifier::is_domain_blocked(const std::string& domain) const {
  return blocked_anywhere(normalize_domain(domain));
}

std::vector<BlockedDomainInfo> SourceVerifier::get_blocked_domains_info() const {
  std::vector<BlockedDomainInfo> out;
  for (const auto& domain : store_->blocked_domains()) {
    BlockedDomainInfo info;
    info.domain = domain;
    const auto state = store_->get_domain_state(domain);
    if (state.has_value() && state->is_blocked) {
      info.blocked_at = state->blocked_at;
      info.reason = state->block_reason;
      info.cause_id = state->block_cause_id;
      info.original_trust_level = state->original_trust_level;
      info.domain_block_reason = state->block_reason_code.value_or(DomainBlockReason::kUnknown);
      info.can_restore = state->original_trust_level.has_value();
    } else {
      info.reason = "Domain is blocked";
    }
    out.push_back(std::move(info));
  }
  return out;
}

std::optional<DomainVerificationState> SourceVerifier::get_domain_state(
    const std::string& domain) const {
  return store_->get_domain_state(normalize_domain(domain));
}

std::vector<DomainVerificationState> SourceVerifier::get_all_domain_states() const {
  return store_->all_domain_states();
}

std::size_t SourceVerifier::get_pending_notification_count() const {
  return store_->pending_notification_count();
}

std::future<std::vector<NotificationOutcome>> SourceVerifier::send_pending_notifications(
    INotifier& notifier, const std::optional<std::string>& task_id) {
  std::vector<BlockedDomainNotification> batch = store_->drain_notifications();
  if (task_id.has_value()) {
    for (auto& n : batch) {
      n.task_id = *task_id;
    }
  }

  return std::async(std::launch::async, [batch = std::move(batch), &notifier,
                                         logger = logger_]() {
    std::vector<NotificationOutcome> outcomes;
    outcomes.reserve(batch.size());
    for (const auto& n : batch) {
      NotificationOutcome outcome;
      outcome.notification = n;
      try {
        outcome.receipt = notifier.notify_domain_blocked(n);
        outcome.delivered = true;
      } catch (const std::exception& e) {
        outcome.error = e.what();
        logger.error("notification_failed",
                     {{"domain", n.domain}, {"cause_id", n.cause_id}, {"error", outcome.error}});
      }
      outcomes.push_back(std::move(outcome));
    }
    return outcomes;
  });
}

response::ResponseMetaBuilder SourceVerifier::build_response_meta(
    const std::vector<VerificationResult>& results) const {
  response::ResponseMetaBuilder builder(clock_->now_iso8601());
  bool degraded = false;

  for (const auto& r : results) {
    builder.add_claim_meta(
        {r.claim_id, r.new_trust_level, r.verification_status, r.details, r.domain});

    if (r.new_trust_level == TrustLevel::kBlocked) {
      builder.add_blocked_domain(r.domain);
    } else if (r.new_trust_level == TrustLevel::kUnverified) {
      builder.add_unverified_domain(r.domain);
    }

    if (r.promotion_result == PromotionResult::kDemoted) {
      degraded = true;
      const std::string why = r.reason.has_value() ? to_string(*r.reason) : "unknown";
      builder.add_security_warning("domain_blocked", "Domain " + r.domain + " blocked: " + why);
    }
  }

  if (degraded) {
    builder.set_data_quality("degraded");
  }
  return builder;
}

void SourceVerifier::reset() {
  store_->reset();
}

}  // namespace lancet::trust
