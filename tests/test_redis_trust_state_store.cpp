#include "lancet/trust/redis_trust_state_store.h"
#include "trust_store_contract.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <functional>
#include <stdexcept>
#include <string>

using namespace lancet;
namespace contract = lancet::testing::trust_store_contract;

// Helper: Check if Redis integration tests should run
static bool should_run_redis_tests() {
  const char* env = std::getenv("LANCET_TEST_REDIS");
  return env != nullptr && std::string(env) == "1";
}

// Helper: Get Redis URI from environment or use default
static std::string get_redis_uri() {
  const char* env = std::getenv("LANCET_REDIS_URI");
  if (env != nullptr) {
    return std::string(env);
  }
  return "tcp://127.0.0.1:6379";
}

// Runs check against a freshly reset store under its own key prefix.
static void with_redis_store(const std::string& prefix,
                             const std::function<void(trust::ITrustStateStore&)>& check) {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set LANCET_TEST_REDIS=1 to enable)");
  }
  const auto config = trust::parse_redis_uri(get_redis_uri());
  REQUIRE(config.has_value());

  try {
    trust::RedisTrustStateStore store(config.value(), "lancet:test:" + prefix);
    store.reset();
    check(store);
    store.reset();
  } catch (const std::runtime_error& e) {
    FAIL("Redis connection failed: " << e.what());
  }
}

TEST_CASE("RedisTrustStateStore: claim moves between buckets",
          "[trust][store][redis][integration]") {
  with_redis_store("buckets", contract::claim_moves_between_buckets);
}

TEST_CASE("RedisTrustStateStore: baseline applies to new domains",
          "[trust][store][redis][integration]") {
  with_redis_store("baseline", contract::baseline_applies_to_new_domains);
}

TEST_CASE("RedisTrustStateStore: promotion only from UNVERIFIED",
          "[trust][store][redis][integration]") {
  with_redis_store("promotion", contract::promotion_only_from_unverified);
}

TEST_CASE("RedisTrustStateStore: block request blocks and queues",
          "[trust][store][redis][integration]") {
  with_redis_store("block", contract::block_request_blocks_and_queues);
}

TEST_CASE("RedisTrustStateStore: rejection rate auto-blocks",
          "[trust][store][redis][integration]") {
  with_redis_store("rate", contract::rejection_rate_auto_blocks);
}

TEST_CASE("RedisTrustStateStore: TRUSTED never auto-blocks",
          "[trust][store][redis][integration]") {
  with_redis_store("trusted", contract::trusted_never_auto_blocks);
}

TEST_CASE("RedisTrustStateStore: block and unblock round trip",
          "[trust][store][redis][integration]") {
  with_redis_store("unblock", contract::block_and_unblock_round_trip);
}

TEST_CASE("RedisTrustStateStore: blocking an unknown domain uses the baseline",
          "[trust][store][redis][integration]") {
  with_redis_store("baseline-block", contract::block_unknown_domain_uses_baseline);
}

TEST_CASE("RedisTrustStateStore: notifications deduplicate by domain",
          "[trust][store][redis][integration]") {
  with_redis_store("notify", contract::notifications_dedup_by_domain);
}

TEST_CASE("RedisTrustStateStore: concurrent transitions keep one bucket",
          "[trust][store][redis][integration][concurrency]") {
  with_redis_store("race", contract::concurrent_transitions_keep_one_bucket);
}

TEST_CASE("RedisTrustStateStore: reset clears everything",
          "[trust][store][redis][integration]") {
  with_redis_store("reset", contract::reset_clears_everything);
}

TEST_CASE("RedisTrustStateStore: two handles share one state",
          "[trust][store][redis][integration]") {
  with_redis_store("shared", [](trust::ITrustStateStore& first) {
    const auto config = trust::parse_redis_uri(get_redis_uri());
    trust::RedisTrustStateStore second(config.value(), "lancet:test:shared");

    const trust::BlockRequest manual{trust::DomainBlockReason::kManual, "operator", "", ""};
    CHECK(first.block_domain("a.test", manual, trust::TrustLevel::kUnverified, "t1"));
    CHECK(second.is_blocked("a.test"));
    CHECK_FALSE(second.block_domain("a.test", manual, trust::TrustLevel::kUnverified, "t2"));
    CHECK(second.drain_notifications().size() == 1);
    CHECK(first.pending_notification_count() == 0);
  });
}

TEST_CASE("RedisTrustStateStore: unreachable server throws", "[trust][store][redis][integration]") {
  if (!should_run_redis_tests()) {
    SKIP("Redis integration tests disabled (set LANCET_TEST_REDIS=1 to enable)");
  }
  const auto config = trust::parse_redis_uri("tcp://127.0.0.1:1");
  REQUIRE(config.has_value());
  CHECK_THROWS_AS(trust::RedisTrustStateStore(config.value()), std::runtime_error);
}
