#pragma once

#include "lancet/trust/trust_level.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace lancet::trust {

// IDomainPolicyStore supplies the configured baseline trust of a domain.
// nullopt means "no policy"; callers treat it as UNVERIFIED.
class IDomainPolicyStore {
 public:
  virtual ~IDomainPolicyStore() = default;

  [[nodiscard]] virtual std::optional<TrustLevel> get_domain_trust_level(
      const std::string& domain) const = 0;

 protected:
  IDomainPolicyStore() = default;
  IDomainPolicyStore(const IDomainPolicyStore&) = default;
  IDomainPolicyStore& operator=(const IDomainPolicyStore&) = default;
  IDomainPolicyStore(IDomainPolicyStore&&) = default;
  IDomainPolicyStore& operator=(IDomainPolicyStore&&) = default;
};

// InMemoryDomainPolicyStore resolves by exact domain, then by each parent suffix
// ("a.b.example.com" -> "b.example.com" -> "example.com" -> "com").
class InMemoryDomainPolicyStore final : public IDomainPolicyStore {
 public:
  [[nodiscard]] std::optional<TrustLevel> get_domain_trust_level(
      const std::string& domain) const override;

  void set_domain_trust_level(const std::string& domain, TrustLevel level);

 private:
  mutable std::mutex mutex_;
  std::map<std::string, TrustLevel> levels_;
};

// normalize_domain lower-cases domain and strips one trailing dot.
[[nodiscard]] std::string normalize_domain(const std::string& domain);

// parent_domain returns domain without its first label, or "" when it has none.
[[nodiscard]] std::string parent_domain(const std::string& domain);

}  // namespace lancet::trust
