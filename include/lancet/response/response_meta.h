#pragma once

#include "lancet/trust/verification_result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace lancet::response {

// Key under which metadata is attached to every tool response.
inline constexpr const char* kMetaKey = "_lancet_meta";

struct SecurityWarning {
  std::string type;                // NOLINT(readability-identifier-naming)
  std::string message;             // NOLINT(readability-identifier-naming)
  std::string severity{"warning"};  // NOLINT(readability-identifier-naming)
};

struct ClaimMeta {
  std::string claim_id;                                                   // NOLINT(readability-identifier-naming)
  trust::TrustLevel source_trust_level{trust::TrustLevel::kUnverified};   // NOLINT(readability-identifier-naming)
  trust::VerificationStatus verification_status{trust::VerificationStatus::kPending};  // NOLINT(readability-identifier-naming)
  std::optional<trust::VerificationDetails> verification_details;         // NOLINT(readability-identifier-naming)
  std::string source_domain;                                              // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const SecurityWarning& warning);
[[nodiscard]] nlohmann::json to_json(const ClaimMeta& claim);

// ResponseMetaBuilder accumulates the outward-facing security and trust metadata of one
// response. Domain lists are deduplicated in insertion order.
class ResponseMetaBuilder {
 public:
  explicit ResponseMetaBuilder(std::string timestamp) : timestamp_(std::move(timestamp)) {}

  ResponseMetaBuilder& add_security_warning(std::string type, std::string message,
                                            std::string severity = "warning");
  ResponseMetaBuilder& add_blocked_domain(const std::string& domain);
  ResponseMetaBuilder& add_unverified_domain(const std::string& domain);
  ResponseMetaBuilder& set_data_quality(std::string quality);
  ResponseMetaBuilder& add_claim_meta(ClaimMeta claim);

  // build emits {timestamp, data_quality} plus only the non-empty collections
  // (security_warnings, blocked_domains, unverified_domains, claims).
  [[nodiscard]] nlohmann::json build() const;

 private:
  std::string timestamp_;
  std::string data_quality_{"normal"};
  std::vector<SecurityWarning> warnings_;
  std::vector<std::string> blocked_domains_;
  std::vector<std::string> unverified_domains_;
  std::vector<ClaimMeta> claims_;
};

// attach_meta sets response[kMetaKey] = meta. A non-object response is wrapped as
// {"result": response} first.
[[nodiscard]] nlohmann::json attach_meta(nlohmann::json response, nlohmann::json meta);

[[nodiscard]] nlohmann::json create_minimal_meta(const std::string& timestamp);

}  // namespace lancet::response
