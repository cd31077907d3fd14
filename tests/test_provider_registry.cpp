#include "lancet/core/clock.h"
#include "lancet/llm/provider_registry.h"
#include "lancet/logging/log_sink.h"
#include "llm_fakes.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace lancet;
using lancet::testing::ScriptedProvider;

namespace {

struct RegistryFixture {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  logging::InMemoryLogSink sink;
  llm::LlmProviderRegistry registry{logging::Logger(sink, clock, "llm")};

  std::shared_ptr<ScriptedProvider> add(const std::string& name, const std::string& reply = "ok",
                                        const bool make_default = false) {
    auto provider = std::make_shared<ScriptedProvider>(name, reply);
    REQUIRE(registry.register_provider(provider, make_default).has_value());
    return provider;
  }
};

}  // namespace

// ── Registration ────────────────────────────────────────────────────────────

TEST_CASE("LlmProviderRegistry: first provider becomes default", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha");
  f.add("beta");

  CHECK(f.registry.default_name() == "alpha");
  CHECK(f.registry.get_default() == a);
  CHECK(f.registry.list_providers() == std::vector<std::string>{"alpha", "beta"});
  CHECK(f.sink.contains_message("LLM provider registered"));
}

TEST_CASE("LlmProviderRegistry: set_default flag and method", "[llm][registry]") {
  RegistryFixture f;
  f.add("alpha");
  auto b = f.add("beta", "ok", true);
  CHECK(f.registry.get_default() == b);

  REQUIRE(f.registry.set_default("alpha").has_value());
  CHECK(f.registry.default_name() == "alpha");

  const auto missing = f.registry.set_default("gamma");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error() == "Provider 'gamma' not registered");
}

TEST_CASE("LlmProviderRegistry: duplicate and null providers are rejected", "[llm][registry]") {
  RegistryFixture f;
  f.add("alpha");

  const auto dup = f.registry.register_provider(std::make_shared<ScriptedProvider>("alpha"));
  REQUIRE_FALSE(dup.has_value());
  CHECK(dup.error() == "Provider 'alpha' already registered");

  CHECK_FALSE(f.registry.register_provider(nullptr).has_value());
}

TEST_CASE("LlmProviderRegistry: unregistering the default promotes the next",
          "[llm][registry]") {
  RegistryFixture f;
  f.add("beta");
  auto gamma = f.add("gamma");
  f.add("alpha");

  CHECK(f.registry.default_name() == "beta");
  CHECK(f.registry.unregister_provider("beta") != nullptr);
  CHECK(f.registry.default_name() == "alpha");

  CHECK(f.registry.unregister_provider("missing") == nullptr);
  CHECK(f.registry.get("gamma") == gamma);
  CHECK(f.registry.get("beta") == nullptr);

  f.registry.unregister_provider("alpha");
  f.registry.unregister_provider("gamma");
  CHECK_FALSE(f.registry.default_name().has_value());
  CHECK(f.registry.get_default() == nullptr);
}

// ── Fallback ────────────────────────────────────────────────────────────────

TEST_CASE("LlmProviderRegistry: generate uses the default first", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha", "from alpha");
  auto b = f.add("beta", "from beta", true);

  const auto response = f.registry.generate_with_fallback("hello");
  REQUIRE(response.ok());
  CHECK(response.text == "from beta");
  CHECK(response.provider == "beta");
  CHECK(a->prompts().empty());
}

TEST_CASE("LlmProviderRegistry: error and exception fall through to the next provider",
          "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha");
  auto b = f.add("beta");
  auto c = f.add("gamma", "from gamma");
  a->fail_with_status("quota");
  b->throw_on_call("socket closed");

  const auto response = f.registry.generate_with_fallback("hello");
  REQUIRE(response.ok());
  CHECK(response.text == "from gamma");
  CHECK(f.sink.contains_message("LLM provider returned error"));
  CHECK(f.sink.contains_message("LLM provider failed"));
}

TEST_CASE("LlmProviderRegistry: unhealthy providers are skipped", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha", "from alpha");
  f.add("beta", "from beta");
  a->set_health(llm::LlmHealthState::kUnhealthy);

  const auto response = f.registry.chat_with_fallback({{"user", "hi"}});
  REQUIRE(response.ok());
  CHECK(response.text == "from beta");
  CHECK(a->prompts().empty());
}

TEST_CASE("LlmProviderRegistry: explicit order restricts the candidates", "[llm][registry]") {
  RegistryFixture f;
  f.add("alpha", "from alpha");
  auto b = f.add("beta", "from beta");
  b->fail_with_status("overloaded");

  const auto response = f.registry.generate_with_fallback("hello", {}, {"beta", "missing"});
  CHECK_FALSE(response.ok());
  CHECK(response.provider == "none");
  CHECK(response.error_message == "All providers failed: beta: overloaded");
}

TEST_CASE("LlmProviderRegistry: all failures are listed", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha");
  auto b = f.add("beta");
  a->fail_with_status("quota");
  b->set_health(llm::LlmHealthState::kUnhealthy);

  llm::LlmOptions options;
  options.model = "m1";
  const auto response = f.registry.generate_with_fallback("hello", options);
  CHECK(response.status == llm::LlmResponseStatus::kError);
  CHECK(response.model == "m1");
  CHECK(response.error_message == "All providers failed: alpha: quota");
}

TEST_CASE("LlmProviderRegistry: no providers throws", "[llm][registry]") {
  RegistryFixture f;
  CHECK_THROWS_AS(f.registry.generate_with_fallback("hello"), std::runtime_error);
}

// ── Health and lifecycle ────────────────────────────────────────────────────

TEST_CASE("LlmProviderRegistry: health of every provider", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha");
  auto b = f.add("beta");
  b->set_health(llm::LlmHealthState::kDegraded);

  const auto health = f.registry.get_all_health();
  REQUIRE(health.size() == 2);
  CHECK(health.at("alpha").state == llm::LlmHealthState::kHealthy);
  CHECK(health.at("beta").state == llm::LlmHealthState::kDegraded);
  CHECK(std::string(llm::to_string(health.at("beta").state)) == "degraded");
}

TEST_CASE("LlmProviderRegistry: close_all and reset", "[llm][registry]") {
  RegistryFixture f;
  auto a = f.add("alpha");
  auto b = f.add("beta");

  f.registry.close_all();
  CHECK(a->closed());
  CHECK(b->closed());

  f.registry.reset();
  CHECK(f.registry.list_providers().empty());
  CHECK_FALSE(f.registry.default_name().has_value());
}
