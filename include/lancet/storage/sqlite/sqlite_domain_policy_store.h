#pragma once

#include "lancet/core/result.h"
#include "lancet/storage/sqlite/sqlite_db.h"
#include "lancet/trust/domain_override.h"
#include "lancet/trust/domain_policy_store.h"

#include <memory>
#include <string>
#include <vector>

namespace lancet::storage::sqlite {

// SqliteDomainPolicyStore persists baseline domain trust (domain_policies) and operator override
// rules (domain_override_rules). Requires schema v2.
class SqliteDomainPolicyStore final : public trust::IDomainPolicyStore,
                                      public trust::IDomainOverrideStore {
 public:
  explicit SqliteDomainPolicyStore(std::shared_ptr<SqliteDb> db);

  // Exact domain first, then each parent suffix.
  [[nodiscard]] std::optional<trust::TrustLevel> get_domain_trust_level(
      const std::string& domain) const override;

  [[nodiscard]] core::Result<bool, std::string> set_domain_trust_level(
      const std::string& domain, trust::TrustLevel level, const std::string& updated_at);

  // record_override runs the deactivate-then-insert in one transaction.
  [[nodiscard]] core::Result<bool, std::string> record_override(
      const trust::DomainOverrideRule& rule) override;

  [[nodiscard]] std::vector<trust::DomainOverrideRule> list_active_overrides() const override;

 private:
  [[nodiscard]] std::optional<trust::TrustLevel> lookup_exact(const std::string& domain) const;

  std::shared_ptr<SqliteDb> db_;
};

}  // namespace lancet::storage::sqlite
