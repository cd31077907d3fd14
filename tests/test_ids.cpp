#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/core/random.h"
#include "lancet/core/sha256.h"

#include <catch2/catch_test_macros.hpp>

#include <regex>
#include <set>
#include <thread>
#include <vector>

using namespace lancet::core;

TEST_CASE("ID generators produce prefixed hex ids", "[ids]") {
  const std::regex shape("err_[0-9a-f]{16}");

  SECTION("RandomIdGenerator") {
    RandomIdGenerator gen;
    const auto a = gen.next("err");
    const auto b = gen.next("err");
    CHECK(std::regex_match(a, shape));
    CHECK(a != b);
  }

  SECTION("DeterministicIdGenerator") {
    DeterministicIdGenerator gen;
    CHECK(gen.next("err") == "err_0000000000000001");
    CHECK(gen.next("sec") == "sec_0000000000000002");
    CHECK(std::regex_match(gen.next("err"), shape));
  }
}

TEST_CASE("DeterministicIdGenerator is unique under concurrent use", "[ids]") {
  DeterministicIdGenerator gen;
  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  std::vector<std::vector<std::string>> produced(kThreads);

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&gen, &produced, t] {
      for (int i = 0; i < kPerThread; ++i) {
        produced[t].push_back(gen.next("id"));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<std::string> all;
  for (const auto& ids : produced) {
    all.insert(ids.begin(), ids.end());
  }
  CHECK(all.size() == kThreads * kPerThread);
}

TEST_CASE("Clocks", "[clock]") {
  SECTION("SystemClock renders UTC with milliseconds") {
    SystemClock clock;
    const std::regex shape(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    CHECK(std::regex_match(clock.now_iso8601(), shape));
  }

  SECTION("FixedClock returns the configured time") {
    FixedClock clock("2026-01-01T00:00:00Z");
    CHECK(clock.now_iso8601() == "2026-01-01T00:00:00Z");
    clock.set("2026-01-02T00:00:00Z");
    CHECK(clock.now_iso8601() == "2026-01-02T00:00:00Z");
  }
}

TEST_CASE("random_hex and to_hex", "[random]") {
  CHECK(random_hex(16).size() == 32);
  CHECK(random_hex(0).empty());
  CHECK(random_hex(16) != random_hex(16));

  const unsigned char bytes[] = {0x00, 0x0f, 0xab, 0xff};
  CHECK(to_hex(bytes, sizeof(bytes)) == "000fabff");
}

TEST_CASE("sha256_hex matches known digests", "[sha256]") {
  CHECK(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  CHECK(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  CHECK(sha256_prefix("abc", 8) == "ba7816bf");
}
