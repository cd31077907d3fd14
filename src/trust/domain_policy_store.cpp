#include "lancet/trust/domain_policy_store.h"

#include "lancet/core/ascii.h"

namespace lancet::trust {

std::string normalize_domain(const std::string& domain) {
  std::string out = core::normalize_ascii_lower(core::trim(domain));
  if (!out.empty() && out.back() == '.') {
    out.pop_back();
  }
  return out;
}

std::string parent_domain(const std::string& domain) {
  const auto dot = domain.find('.');
  if (dot == std::string::npos) {
    return "";
  }
  return domain.substr(dot + 1);
}

std::optional<TrustLevel> InMemoryDomainPolicyStore::get_domain_trust_level(
    const std::string& domain) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::string d = normalize_domain(domain); !d.empty(); d = parent_domain(d)) {
    const auto it = levels_.find(d);
    if (it != levels_.end()) {
      return it->second;
    }
  }
  return std::nullopt;
}

void InMemoryDomainPolicyStore::set_domain_trust_level(const std::string& domain,
                                                       const TrustLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  levels_[normalize_domain(domain)] = level;
}

}  // namespace lancet::trust
