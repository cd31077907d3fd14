#include "lancet/trust/inmemory_trust_state_store.h"
#include "trust_store_contract.h"

#include <catch2/catch_test_macros.hpp>

using namespace lancet;
namespace contract = lancet::testing::trust_store_contract;

TEST_CASE("InMemoryTrustStateStore: claim moves between buckets", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::claim_moves_between_buckets(store);
}

TEST_CASE("InMemoryTrustStateStore: baseline applies to new domains", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::baseline_applies_to_new_domains(store);
}

TEST_CASE("InMemoryTrustStateStore: promotion only from UNVERIFIED", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::promotion_only_from_unverified(store);
}

TEST_CASE("InMemoryTrustStateStore: block request blocks and queues", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::block_request_blocks_and_queues(store);
}

TEST_CASE("InMemoryTrustStateStore: rejection rate auto-blocks", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::rejection_rate_auto_blocks(store);
}

TEST_CASE("InMemoryTrustStateStore: TRUSTED never auto-blocks", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::trusted_never_auto_blocks(store);
}

TEST_CASE("InMemoryTrustStateStore: block and unblock round trip", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::block_and_unblock_round_trip(store);
}

TEST_CASE("InMemoryTrustStateStore: blocking an unknown domain uses the baseline",
          "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::block_unknown_domain_uses_baseline(store);
}

TEST_CASE("InMemoryTrustStateStore: notifications deduplicate by domain", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::notifications_dedup_by_domain(store);
}

TEST_CASE("InMemoryTrustStateStore: concurrent transitions keep one bucket",
          "[trust][store][concurrency]") {
  trust::InMemoryTrustStateStore store;
  contract::concurrent_transitions_keep_one_bucket(store);
}

TEST_CASE("InMemoryTrustStateStore: reset clears everything", "[trust][store]") {
  trust::InMemoryTrustStateStore store;
  contract::reset_clears_everything(store);
}
