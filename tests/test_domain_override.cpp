#include "lancet/core/clock.h"
#include "lancet/logging/log_sink.h"
#include "lancet/logging/logger.h"
#include "lancet/trust/domain_override.h"
#include "lancet/trust/domain_policy_store.h"
#include "lancet/trust/inmemory_trust_state_store.h"
#include "lancet/trust/source_verifier.h"

#include <catch2/catch_test_macros.hpp>

using namespace lancet;
using namespace lancet::trust;

namespace {

DomainOverrideRule make_rule(const std::string& rule_id, const std::string& pattern,
                             const OverrideDecision decision, const std::string& reason = "") {
  DomainOverrideRule rule;
  rule.rule_id = rule_id;
  rule.domain_pattern = pattern;
  rule.decision = decision;
  rule.reason = reason;
  rule.created_at = "2026-01-01T00:00:00Z";
  rule.updated_at = "2026-01-01T00:00:00Z";
  return rule;
}

struct ReplayFixture {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  logging::InMemoryLogSink sink;
  InMemoryTrustStateStore store;
  InMemoryDomainPolicyStore policy;
  SourceVerifier verifier{store, policy, clock, logging::Logger(sink, clock, "overrides")};
};

}  // namespace

// ── Helpers ─────────────────────────────────────────────────────────────────

TEST_CASE("OverrideDecision: parse and to_string", "[trust][override]") {
  CHECK(to_string(OverrideDecision::kBlock) == "block");
  CHECK(to_string(OverrideDecision::kUnblock) == "unblock");
  CHECK(parse_override_decision("block") == OverrideDecision::kBlock);
  CHECK(parse_override_decision("unblock") == OverrideDecision::kUnblock);
  CHECK_FALSE(parse_override_decision("BLOCK").has_value());
  CHECK_FALSE(parse_override_decision("").has_value());
}

TEST_CASE("override_target: wildcard prefix applies to the bare domain", "[trust][override]") {
  CHECK(override_target("*.example.com") == "example.com");
  CHECK(override_target("Example.COM.") == "example.com");
  CHECK(override_target(" *.Example.com ") == "example.com");
  CHECK(override_target("sub.example.com") == "sub.example.com");
  CHECK(override_target("").empty());
}

TEST_CASE("InMemoryDomainPolicyStore: parent suffix lookup", "[trust][policy]") {
  InMemoryDomainPolicyStore policy;
  policy.set_domain_trust_level("Example.com", TrustLevel::kTrusted);
  CHECK(policy.get_domain_trust_level("docs.example.com") == TrustLevel::kTrusted);
  CHECK(policy.get_domain_trust_level("example.com.") == TrustLevel::kTrusted);
  CHECK_FALSE(policy.get_domain_trust_level("example.org").has_value());
  CHECK(parent_domain("a.b.c") == "b.c");
  CHECK(parent_domain("com").empty());
}

// ── InMemoryDomainOverrideStore ─────────────────────────────────────────────

TEST_CASE("InMemoryDomainOverrideStore: later rule supersedes same pattern",
          "[trust][override]") {
  InMemoryDomainOverrideStore store;
  REQUIRE(store.record_override(make_rule("r1", "bad.com", OverrideDecision::kBlock)).has_value());
  REQUIRE(store.record_override(make_rule("r2", "x.com", OverrideDecision::kBlock)).has_value());
  REQUIRE(
      store.record_override(make_rule("r3", "bad.com", OverrideDecision::kUnblock)).has_value());

  const auto rules = store.list_active_overrides();
  REQUIRE(rules.size() == 2);
  CHECK(rules[0].rule_id == "r2");
  CHECK(rules[1].rule_id == "r3");
}

TEST_CASE("InMemoryDomainOverrideStore: rejects rules without id or domain",
          "[trust][override]") {
  InMemoryDomainOverrideStore store;
  CHECK_FALSE(store.record_override(make_rule("", "bad.com", OverrideDecision::kBlock))
                  .has_value());
  CHECK_FALSE(store.record_override(make_rule("r1", "  ", OverrideDecision::kBlock)).has_value());
  CHECK(store.list_active_overrides().empty());
}

// ── apply_domain_overrides ──────────────────────────────────────────────────

TEST_CASE("apply_domain_overrides: block rules block with their reason and id",
          "[trust][override]") {
  ReplayFixture f;
  const auto replay = apply_domain_overrides(
      {make_rule("r1", "*.bad.com", OverrideDecision::kBlock, "phishing"),
       make_rule("r2", "worse.com", OverrideDecision::kBlock)},
      f.verifier);

  CHECK(replay.blocks == 2);
  CHECK(replay.unblocks == 0);
  CHECK(f.verifier.is_domain_blocked("bad.com"));

  const auto bad = f.verifier.get_domain_state("bad.com");
  REQUIRE(bad.has_value());
  CHECK(bad->block_reason == "phishing");
  CHECK(bad->block_cause_id == "r1");
  CHECK(bad->block_reason_code == DomainBlockReason::kManual);

  const auto worse = f.verifier.get_domain_state("worse.com");
  REQUIRE(worse.has_value());
  CHECK(worse->block_reason == "Loaded from DB");
}

TEST_CASE("apply_domain_overrides: newest rule decides", "[trust][override]") {
  ReplayFixture f;
  const auto replay = apply_domain_overrides(
      {make_rule("r1", "bad.com", OverrideDecision::kBlock),
       make_rule("r2", "bad.com", OverrideDecision::kUnblock)},
      f.verifier);

  CHECK(replay.blocks == 1);
  CHECK(replay.unblocks == 1);
  CHECK_FALSE(f.verifier.is_domain_blocked("bad.com"));
}

TEST_CASE("apply_domain_overrides: inactive and empty rules are skipped", "[trust][override]") {
  ReplayFixture f;
  auto inactive = make_rule("r1", "bad.com", OverrideDecision::kBlock);
  inactive.is_active = false;

  const auto replay = apply_domain_overrides(
      {inactive, make_rule("r2", "   ", OverrideDecision::kBlock)}, f.verifier);
  CHECK(replay.blocks == 0);
  CHECK_FALSE(f.verifier.is_domain_blocked("bad.com"));
  CHECK(f.verifier.get_blocked_domains_info().empty());
}
