#pragma once

#include "lancet/core/result.h"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::trust {

class SourceVerifier;

enum class OverrideDecision {
  kBlock,
  kUnblock,
};

[[nodiscard]] std::string to_string(OverrideDecision decision);
[[nodiscard]] std::optional<OverrideDecision> parse_override_decision(std::string_view value);

// DomainOverrideRule is a persisted operator decision from feedback(domain_block|domain_unblock).
// A "*.example.com" pattern applies to "example.com".
struct DomainOverrideRule {
  std::string rule_id;                             // NOLINT(readability-identifier-naming)
  std::string domain_pattern;                      // NOLINT(readability-identifier-naming)
  OverrideDecision decision{OverrideDecision::kBlock};  // NOLINT(readability-identifier-naming)
  std::string reason;                              // NOLINT(readability-identifier-naming)
  std::string created_at;                          // NOLINT(readability-identifier-naming)
  std::string updated_at;                          // NOLINT(readability-identifier-naming)
  bool is_active{true};                            // NOLINT(readability-identifier-naming)
  std::string created_by{"feedback"};              // NOLINT(readability-identifier-naming)
};

// IDomainOverrideStore persists override rules so they survive a restart.
class IDomainOverrideStore {
 public:
  virtual ~IDomainOverrideStore() = default;

  // record_override deactivates earlier active rules for the same pattern and stores rule.
  [[nodiscard]] virtual core::Result<bool, std::string> record_override(
      const DomainOverrideRule& rule) = 0;

  // Active rules, oldest first.
  [[nodiscard]] virtual std::vector<DomainOverrideRule> list_active_overrides() const = 0;

 protected:
  IDomainOverrideStore() = default;
  IDomainOverrideStore(const IDomainOverrideStore&) = default;
  IDomainOverrideStore& operator=(const IDomainOverrideStore&) = default;
  IDomainOverrideStore(IDomainOverrideStore&&) = default;
  IDomainOverrideStore& operator=(IDomainOverrideStore&&) = default;
};

// InMemoryDomainOverrideStore keeps rules for the process lifetime.
class InMemoryDomainOverrideStore final : public IDomainOverrideStore {
 public:
  [[nodiscard]] core::Result<bool, std::string> record_override(
      const DomainOverrideRule& rule) override;
  [[nodiscard]] std::vector<DomainOverrideRule> list_active_overrides() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<DomainOverrideRule> rules_;
};

// override_target returns the domain a rule pattern applies to.
[[nodiscard]] std::string override_target(const std::string& domain_pattern);

struct OverrideReplay {
  int blocks{0};    // NOLINT(readability-identifier-naming)
  int unblocks{0};  // NOLINT(readability-identifier-naming)
};

// apply_domain_overrides replays active rules oldest first, so the newest rule for a domain
// decides its final state.
OverrideReplay apply_domain_overrides(const std::vector<DomainOverrideRule>& rules,
                                      SourceVerifier& verifier);

}  // namespace lancet::trust
