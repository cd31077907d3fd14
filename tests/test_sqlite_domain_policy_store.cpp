#include "lancet/storage/sqlite/sqlite_db.h"
#include "lancet/storage/sqlite/sqlite_domain_policy_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace lancet;
using storage::sqlite::SqliteDomainPolicyStore;
using trust::DomainOverrideRule;
using trust::OverrideDecision;
using trust::TrustLevel;

static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  REQUIRE(db->ensure_schema_v2().has_value());
  return db;
}

static DomainOverrideRule make_rule(const std::string& rule_id, const std::string& pattern,
                                    const OverrideDecision decision, const std::string& at) {
  DomainOverrideRule rule;
  rule.rule_id = rule_id;
  rule.domain_pattern = pattern;
  rule.decision = decision;
  rule.reason = "operator feedback";
  rule.created_at = at;
  rule.updated_at = at;
  return rule;
}

// ── Domain policies ─────────────────────────────────────────────────────────

TEST_CASE("SqliteDomainPolicyStore: unknown domain has no policy", "[sqlite][domain_policy]") {
  SqliteDomainPolicyStore store(make_db());
  CHECK_FALSE(store.get_domain_trust_level("example.com").has_value());
}

TEST_CASE("SqliteDomainPolicyStore: exact match wins over parent", "[sqlite][domain_policy]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.set_domain_trust_level("example.com", TrustLevel::kTrusted, "t0").has_value());
  REQUIRE(store.set_domain_trust_level("ads.example.com", TrustLevel::kBlocked, "t0")
              .has_value());

  CHECK(store.get_domain_trust_level("ads.example.com") == TrustLevel::kBlocked);
  CHECK(store.get_domain_trust_level("docs.example.com") == TrustLevel::kTrusted);
  CHECK(store.get_domain_trust_level("a.b.example.com") == TrustLevel::kTrusted);
  CHECK_FALSE(store.get_domain_trust_level("example.org").has_value());
}

TEST_CASE("SqliteDomainPolicyStore: domains are normalized on write and read",
          "[sqlite][domain_policy]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.set_domain_trust_level("Example.COM.", TrustLevel::kLow, "t0").has_value());
  CHECK(store.get_domain_trust_level("EXAMPLE.com") == TrustLevel::kLow);
}

TEST_CASE("SqliteDomainPolicyStore: setting twice updates the level", "[sqlite][domain_policy]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.set_domain_trust_level("example.com", TrustLevel::kLow, "t0").has_value());
  REQUIRE(store.set_domain_trust_level("example.com", TrustLevel::kTrusted, "t1").has_value());
  CHECK(store.get_domain_trust_level("example.com") == TrustLevel::kTrusted);
}

// ── Override rules ──────────────────────────────────────────────────────────

TEST_CASE("SqliteDomainPolicyStore: override rules persist", "[sqlite][domain_override]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.record_override(make_rule("r1", "bad.com", OverrideDecision::kBlock, "t1"))
              .has_value());

  const auto rules = store.list_active_overrides();
  REQUIRE(rules.size() == 1);
  CHECK(rules[0].rule_id == "r1");
  CHECK(rules[0].domain_pattern == "bad.com");
  CHECK(rules[0].decision == OverrideDecision::kBlock);
  CHECK(rules[0].reason == "operator feedback");
  CHECK(rules[0].created_by == "feedback");
}

TEST_CASE("SqliteDomainPolicyStore: a new rule deactivates the previous one for its pattern",
          "[sqlite][domain_override]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.record_override(make_rule("r1", "bad.com", OverrideDecision::kBlock, "t1"))
              .has_value());
  REQUIRE(store.record_override(make_rule("r2", "other.com", OverrideDecision::kBlock, "t2"))
              .has_value());
  REQUIRE(store.record_override(make_rule("r3", "bad.com", OverrideDecision::kUnblock, "t3"))
              .has_value());

  const auto rules = store.list_active_overrides();
  REQUIRE(rules.size() == 2);
  CHECK(rules[0].rule_id == "r2");
  CHECK(rules[1].rule_id == "r3");
  CHECK(rules[1].decision == OverrideDecision::kUnblock);
}

TEST_CASE("SqliteDomainPolicyStore: active rules come back oldest first",
          "[sqlite][domain_override]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.record_override(make_rule("late", "b.com", OverrideDecision::kBlock,
                                          "2026-01-02T00:00:00Z"))
              .has_value());
  REQUIRE(store.record_override(make_rule("early", "a.com", OverrideDecision::kBlock,
                                          "2026-01-01T00:00:00Z"))
              .has_value());
  REQUIRE(store.record_override(make_rule("tie", "c.com", OverrideDecision::kBlock,
                                          "2026-01-02T00:00:00Z"))
              .has_value());

  const auto rules = store.list_active_overrides();
  REQUIRE(rules.size() == 3);
  CHECK(rules[0].rule_id == "early");
  CHECK(rules[1].rule_id == "late");
  CHECK(rules[2].rule_id == "tie");
}

TEST_CASE("SqliteDomainPolicyStore: duplicate rule id rolls back", "[sqlite][domain_override]") {
  SqliteDomainPolicyStore store(make_db());
  REQUIRE(store.record_override(make_rule("r1", "bad.com", OverrideDecision::kBlock, "t1"))
              .has_value());

  const auto dup = store.record_override(make_rule("r1", "bad.com", OverrideDecision::kUnblock,
                                                   "t2"));
  CHECK_FALSE(dup.has_value());

  // The deactivation was rolled back with the failed insert.
  const auto rules = store.list_active_overrides();
  REQUIRE(rules.size() == 1);
  CHECK(rules[0].decision == OverrideDecision::kBlock);

  // The store is usable after the rollback.
  CHECK(store.record_override(make_rule("r2", "bad.com", OverrideDecision::kUnblock, "t3"))
            .has_value());
}
