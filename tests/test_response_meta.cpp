#include "lancet/response/errors.h"
#include "lancet/response/response_meta.h"

#include <catch2/catch_test_macros.hpp>

using namespace lancet;
using namespace lancet::response;
using nlohmann::json;

// ── ResponseMetaBuilder ───────────────────────────────────────────────────

TEST_CASE("ResponseMetaBuilder: empty builder emits only timestamp and quality",
          "[response][meta]") {
  const auto meta = ResponseMetaBuilder("2026-01-01T00:00:00Z").build();
  CHECK(meta == json{{"timestamp", "2026-01-01T00:00:00Z"}, {"data_quality", "normal"}});
  CHECK(meta == create_minimal_meta("2026-01-01T00:00:00Z"));
}

TEST_CASE("ResponseMetaBuilder: domain lists are deduplicated in order", "[response][meta]") {
  ResponseMetaBuilder builder("t");
  builder.add_blocked_domain("b.test").add_blocked_domain("a.test").add_blocked_domain("b.test");
  builder.add_unverified_domain("u.test").add_unverified_domain("u.test");
  const auto meta = builder.build();
  CHECK(meta["blocked_domains"] == json::array({"b.test", "a.test"}));
  CHECK(meta["unverified_domains"] == json::array({"u.test"}));
}

TEST_CASE("ResponseMetaBuilder: warnings and quality", "[response][meta]") {
  ResponseMetaBuilder builder("t");
  builder.add_security_warning("domain_blocked", "Domain x blocked")
      .add_security_warning("prompt_leakage", "masked", "critical")
      .set_data_quality("degraded");
  const auto meta = builder.build();
  CHECK(meta["data_quality"] == "degraded");
  REQUIRE(meta["security_warnings"].size() == 2);
  CHECK(meta["security_warnings"][0]["severity"] == "warning");
  CHECK(meta["security_warnings"][1]["severity"] == "critical");
}

TEST_CASE("ResponseMetaBuilder: claim metadata", "[response][meta]") {
  trust::VerificationDetails details;
  details.independent_sources = 2;
  ResponseMetaBuilder builder("t");
  builder.add_claim_meta({"c1", trust::TrustLevel::kLow, trust::VerificationStatus::kVerified,
                          details, "example.com"});
  builder.add_claim_meta({"c2", trust::TrustLevel::kUnverified,
                          trust::VerificationStatus::kPending, std::nullopt, ""});
  const auto meta = builder.build();
  REQUIRE(meta["claims"].size() == 2);
  CHECK(meta["claims"][0]["claim_id"] == "c1");
  CHECK(meta["claims"][0]["source_trust_level"] == "low");
  CHECK(meta["claims"][0]["verification_status"] == "verified");
  CHECK(meta["claims"][0]["source_domain"] == "example.com");
  CHECK(meta["claims"][0].contains("verification_details"));
  CHECK_FALSE(meta["claims"][1].contains("verification_details"));
  CHECK_FALSE(meta["claims"][1].contains("source_domain"));
}

// ── attach_meta ───────────────────────────────────────────────────────────

TEST_CASE("attach_meta: sets the metadata key on objects", "[response][meta]") {
  const auto out = attach_meta(json{{"ok", true}}, create_minimal_meta("t"));
  CHECK(out["ok"] == true);
  CHECK(out[kMetaKey]["timestamp"] == "t");
}

TEST_CASE("attach_meta: wraps non-object responses", "[response][meta]") {
  const auto out = attach_meta(json::array({1, 2}), create_minimal_meta("t"));
  CHECK(out["result"] == json::array({1, 2}));
  CHECK(out.contains(kMetaKey));
}

TEST_CASE("attach_meta: replaces existing metadata", "[response][meta]") {
  const auto first = attach_meta(json{{"ok", true}}, json{{"timestamp", "old"}});
  const auto second = attach_meta(first, create_minimal_meta("new"));
  CHECK(second[kMetaKey]["timestamp"] == "new");
}

// ── McpToolError ──────────────────────────────────────────────────────────

TEST_CASE("McpToolError: renders the client error payload", "[response][errors]") {
  const McpToolError error(McpErrorCode::kTimeout, "took too long");
  CHECK(error.to_json() ==
        json{{"ok", false}, {"error_code", "TIMEOUT"}, {"error", "took too long"}});
  CHECK(error.to_json(std::string{"err_1"})["error_id"] == "err_1");
}

TEST_CASE("invalid_params: records the parameter name", "[response][errors]") {
  const auto error = invalid_params("text is required", "text");
  CHECK(error.code() == McpErrorCode::kInvalidParams);
  CHECK(error.details()["param_name"] == "text");
  CHECK(error.to_json()["details"]["param_name"] == "text");
  CHECK_FALSE(invalid_params("bad").to_json().contains("details"));
}

TEST_CASE("to_string(McpErrorCode): upper snake case", "[response][errors]") {
  CHECK(std::string(to_string(McpErrorCode::kAllEnginesBlocked)) == "ALL_ENGINES_BLOCKED");
  CHECK(std::string(to_string(McpErrorCode::kInternalError)) == "INTERNAL_ERROR");
}
