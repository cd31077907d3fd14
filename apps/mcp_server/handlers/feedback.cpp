#include "feedback.h"

#include "lancet/core/ascii.h"
#include "lancet/response/errors.h"
#include "lancet/storage/security_event.h"
#include "lancet/trust/domain_override.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace lancet::mcp::handlers {

using json = nlohmann::json;

namespace {

// Patterns that would block or unblock a whole top-level domain.
constexpr std::array<std::string_view, 8> kForbiddenPatterns = {
    "*", "**", "*.com", "*.co.jp", "*.org", "*.net", "*.gov", "*.edu",
};

std::string required_string(const json& params, const std::string& name,
                            const std::string& action) {
  const auto it = params.find(name);
  if (it == params.end() || !it->is_string()) {
    throw response::invalid_params(name + " is required for " + action, name);
  }
  std::string value = core::trim(it->get<std::string>());
  if (value.empty()) {
    throw response::invalid_params(name + " is required for " + action, name);
  }
  return value;
}

json record_domain_override(const json& params, ServerContext& ctx,
                            trust::OverrideDecision decision) {
  const std::string action = "domain_" + trust::to_string(decision);
  const std::string pattern = core::normalize_ascii_lower(
      required_string(params, "domain_pattern", action));
  validate_domain_pattern(pattern);
  const std::string reason = required_string(params, "reason", action);

  const std::string now = ctx.clock.now_iso8601();
  trust::DomainOverrideRule rule;
  rule.rule_id = ctx.id_gen.next("dor");
  rule.domain_pattern = pattern;
  rule.decision = decision;
  rule.reason = reason;
  rule.created_at = now;
  rule.updated_at = now;

  const auto stored = ctx.services.overrides.record_override(rule);
  if (!stored.has_value()) {
    throw response::McpToolError(response::McpErrorCode::kPipelineError,
                                 "Failed to persist domain override");
  }

  auto& verifier = ctx.services.verifier;
  const std::string target = trust::override_target(pattern);
  bool changed = false;
  if (decision == trust::OverrideDecision::kBlock) {
    changed = verifier.block_domain_manual(target, reason, rule.rule_id);
    ctx.services.audit.log_security_event(storage::SecurityEventType::kDomainBlocked,
                                          storage::Severity::kMedium,
                                          {{"domain", target}, {"rule_id", rule.rule_id}});
  } else {
    changed = verifier.unblock_domain(target);
    ctx.services.audit.log_security_event(storage::SecurityEventType::kDomainUnblocked,
                                          storage::Severity::kMedium,
                                          {{"domain", target}, {"rule_id", rule.rule_id}});
  }

  ctx.secure_log.log_sensitive_operation(action, {{"domain", target}, {"rule_id", rule.rule_id}});

  json result{{"ok", true},
              {"action", action},
              {"domain_pattern", pattern},
              {"rule_id", rule.rule_id},
              {"changed", changed}};
  if (decision == trust::OverrideDecision::kBlock) {
    result["message"] = "Domain '" + pattern + "' blocked. Claims from it are rejected.";
  } else {
    result["message"] = changed ? "Domain '" + pattern + "' unblocked."
                                : "Domain '" + pattern + "' was not blocked.";
  }
  return result;
}

json reject_claim(const json& params, ServerContext& ctx) {
  const std::string claim_id = required_string(params, "claim_id", "claim_reject");
  const std::string domain = required_string(params, "domain", "claim_reject");
  const std::string reason = required_string(params, "reason", "claim_reject");

  const auto result = ctx.services.verifier.reject_claim(claim_id, domain, reason);
  ctx.secure_log.log_sensitive_operation("claim_reject",
                                         {{"claim_id", claim_id}, {"domain", result.domain}});

  json out{{"ok", true},
           {"action", "claim_reject"},
           {"claim_id", claim_id},
           {"domain", result.domain},
           {"trust_level", trust::to_string(result.new_trust_level)}};
  if (result.reason.has_value()) {
    out["reason_code"] = trust::to_string(*result.reason);
  }
  auto meta = ctx.services.verifier.build_response_meta({result});
  return response::attach_meta(std::move(out), meta.build());
}

}  // namespace

void validate_domain_pattern(const std::string& pattern) {
  if (pattern.empty()) {
    throw response::invalid_params("domain_pattern is required and cannot be empty",
                                   "domain_pattern");
  }
  if (std::find(kForbiddenPatterns.begin(), kForbiddenPatterns.end(), pattern) !=
      kForbiddenPatterns.end()) {
    throw response::invalid_params(
        "Forbidden domain pattern: '" + pattern + "'. Cannot block/unblock at TLD level.",
        "domain_pattern");
  }
  if (trust::override_target(pattern).empty()) {
    throw response::invalid_params("domain_pattern does not name a domain", "domain_pattern");
  }
}

json handle_feedback(const json& params, ServerContext& ctx) {
  const auto it = params.find("action");
  const std::string action = (it != params.end() && it->is_string()) ? it->get<std::string>() : "";

  if (action == "domain_block") {
    return record_domain_override(params, ctx, trust::OverrideDecision::kBlock);
  }
  if (action == "domain_unblock") {
    return record_domain_override(params, ctx, trust::OverrideDecision::kUnblock);
  }
  if (action == "claim_reject") {
    return reject_claim(params, ctx);
  }
  throw response::invalid_params(
      "Unknown action: " + action + " (expected domain_block, domain_unblock or claim_reject)",
      "action");
}

}  // namespace lancet::mcp::handlers
