#include "lancet/trust/domain_override.h"

#include "lancet/trust/domain_policy_store.h"
#include "lancet/trust/source_verifier.h"

namespace lancet::trust {

std::string to_string(const OverrideDecision decision) {
  return decision == OverrideDecision::kBlock ? "block" : "unblock";
}

std::optional<OverrideDecision> parse_override_decision(const std::string_view value) {
  if (value == "block") {
    return OverrideDecision::kBlock;
  }
  if (value == "unblock") {
    return OverrideDecision::kUnblock;
  }
  return std::nullopt;
}

std::string override_target(const std::string& domain_pattern) {
  std::string target = normalize_domain(domain_pattern);
  if (target.rfind("*.", 0) == 0) {
    target.erase(0, 2);
  }
  return target;
}

core::Result<bool, std::string> InMemoryDomainOverrideStore::record_override(
    const DomainOverrideRule& rule) {
  if (rule.rule_id.empty() || override_target(rule.domain_pattern).empty()) {
    return core::Result<bool, std::string>::err("override rule needs a rule_id and a domain");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& existing : rules_) {
    if (existing.is_active && existing.domain_pattern == rule.domain_pattern) {
      existing.is_active = false;
      existing.updated_at = rule.updated_at;
    }
  }
  rules_.push_back(rule);
  return core::Result<bool, std::string>::ok(true);
}

std::vector<DomainOverrideRule> InMemoryDomainOverrideStore::list_active_overrides() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DomainOverrideRule> active;
  for (const auto& rule : rules_) {
    if (rule.is_active) {
      active.push_back(rule);
    }
  }
  return active;
}

OverrideReplay apply_domain_overrides(const std::vector<DomainOverrideRule>& rules,
                                      SourceVerifier& verifier) {
  OverrideReplay replay;
  for (const auto& rule : rules) {
    if (!rule.is_active) {
      continue;
    }
    const std::string target = override_target(rule.domain_pattern);
    if (target.empty()) {
      continue;
    }
    switch (rule.decision) {
      case OverrideDecision::kBlock:
        verifier.block_domain_manual(target, rule.reason.empty() ? "Loaded from DB" : rule.reason,
                                     rule.rule_id);
        ++replay.blocks;
        break;
      case OverrideDecision::kUnblock:
        verifier.unblock_domain(target);
        ++replay.unblocks;
        break;
    }
  }
  return replay;
}

}  // namespace lancet::trust
