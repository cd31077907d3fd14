#include "lancet/response/response_meta.h"

#include <algorithm>

namespace lancet::response {

nlohmann::json to_json(const SecurityWarning& warning) {
  return nlohmann::json{
      {"type", warning.type}, {"message", warning.message}, {"severity", warning.severity}};
}

nlohmann::json to_json(const ClaimMeta& claim) {
  nlohmann::json j{{"claim_id", claim.claim_id},
                   {"source_trust_level", trust::to_string(claim.source_trust_level)},
                   {"verification_status", trust::to_string(claim.verification_status)}};
  if (claim.verification_details.has_value()) {
    j["verification_details"] = trust::to_json(*claim.verification_details);
  }
  if (!claim.source_domain.empty()) {
    j["source_domain"] = claim.source_domain;
  }
  return j;
}

ResponseMetaBuilder& ResponseMetaBuilder::add_security_warning(std::string type,
                                                               std::string message,
                                                               std::string severity) {
  warnings_.push_back({std::move(type), std::move(message), std::move(severity)});
  return *this;
}

ResponseMetaBuilder& ResponseMetaBuilder::add_blocked_domain(const std::string& domain) {
  if (std::find(blocked_domains_.begin(), blocked_domains_.end(), domain) ==
      blocked_domains_.end()) {
    blocked_domains_.push_back(domain);
  }
  return *this;
}

ResponseMetaBuilder& ResponseMetaBuilder::add_unverified_domain(const std::string& domain) {
  if (std::find(unverified_domains_.begin(), unverified_domains_.end(), domain) ==
      unverified_domains_.end()) {
    unverified_domains_.push_back(domain);
  }
  return *this;
}

ResponseMetaBuilder& ResponseMetaBuilder::set_data_quality(std::string quality) {
  data_quality_ = std::move(quality);
  return *this;
}

ResponseMetaBuilder& ResponseMetaBuilder::add_claim_meta(ClaimMeta claim) {
  claims_.push_back(std::move(claim));
  return *this;
}

nlohmann::json ResponseMetaBuilder::build() const {
  nlohmann::json meta{{"timestamp", timestamp_}, {"data_quality", data_quality_}};

  if (!warnings_.empty()) {
    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : warnings_) {
      warnings.push_back(to_json(w));
    }
    meta["security_warnings"] = std::move(warnings);
  }
  if (!blocked_domains_.empty()) {
    meta["blocked_domains"] = blocked_domains_;
  }
  if (!unverified_domains_.empty()) {
    meta["unverified_domains"] = unverified_domains_;
  }
  if (!claims_.empty()) {
    nlohmann::json claims = nlohmann::json::array();
    for (const auto& c : claims_) {
      claims.push_back(to_json(c));
    }
    meta["claims"] = std::move(claims);
  }
  return meta;
}

nlohmann::json attach_meta(nlohmann::json response, nlohmann::json meta) {
  if (!response.is_object()) {
    response = nlohmann::json{{"result", std::move(response)}};
  }
  response[kMetaKey] = std::move(meta);
  return response;
}

nlohmann::json create_minimal_meta(const std::string& timestamp) {
  return nlohmann::json{{"timestamp", timestamp}, {"data_quality", "normal"}};
}

}  // namespace lancet::response
