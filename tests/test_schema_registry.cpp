#include "lancet/core/clock.h"
#include "lancet/logging/log_sink.h"
#include "lancet/logging/logger.h"
#include "lancet/response/schema_registry.h"
#include "temp_dir.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>

using namespace lancet;
using namespace lancet::response;
using lancet::testing::TempDir;

namespace {

struct RegistryFixture {
  TempDir dir;
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  logging::InMemoryLogSink sink;
  SchemaRegistry registry{dir.path(), logging::Logger(sink, clock, "schemas")};
};

// Moves the file's mtime forward so the registry sees a change regardless of filesystem
// timestamp resolution.
void touch_forward(const std::filesystem::path& file) {
  const auto now = std::filesystem::last_write_time(file);
  std::filesystem::last_write_time(file, now + std::chrono::seconds(2));
}

}  // namespace

TEST_CASE("is_valid_tool_name: accepts identifiers and rejects path tricks", "[response][schema]") {
  CHECK(is_valid_tool_name("get_status"));
  CHECK(is_valid_tool_name("sanitize-preview2"));
  CHECK(is_valid_tool_name(std::string(64, 'a')));
  CHECK_FALSE(is_valid_tool_name(""));
  CHECK_FALSE(is_valid_tool_name(std::string(65, 'a')));
  CHECK_FALSE(is_valid_tool_name("../etc/passwd"));
  CHECK_FALSE(is_valid_tool_name("a.b"));
  CHECK_FALSE(is_valid_tool_name("a/b"));
  CHECK_FALSE(is_valid_tool_name("tool name"));
}

TEST_CASE("load_schema_file: distinguishes missing and malformed", "[response][schema]") {
  TempDir dir;
  CHECK(load_schema_file(dir.path() / "nope.json").error() == core::SchemaError::kNotFound);
  CHECK(load_schema_file(dir.write("bad.json", "{not json")).error() ==
        core::SchemaError::kMalformed);
  CHECK(load_schema_file(dir.write("array.json", "[1,2]")).error() ==
        core::SchemaError::kMalformed);

  const auto ok = load_schema_file(dir.write("ok.json", R"({"type":"object"})"));
  REQUIRE(ok.has_value());
  CHECK((*ok.value())["type"] == "object");
}

TEST_CASE("SchemaRegistry: returns nullptr for a missing schema", "[response][schema]") {
  RegistryFixture f;
  CHECK(f.registry.get_schema("absent") == nullptr);
  CHECK(f.sink.contains_message("schema_missing"));
}

TEST_CASE("SchemaRegistry: rejects invalid tool names without touching disk",
          "[response][schema]") {
  RegistryFixture f;
  f.dir.write("x.json", R"({"type":"object"})");
  CHECK(f.registry.get_schema("../x") == nullptr);
  CHECK(f.sink.contains_message("schema_invalid_tool_name"));
}

TEST_CASE("SchemaRegistry: caches until the file changes", "[response][schema]") {
  RegistryFixture f;
  const auto file = f.dir.write("tool.json", R"({"title":"v1"})");

  const auto first = f.registry.get_schema("tool");
  REQUIRE(first != nullptr);
  CHECK((*first)["title"] == "v1");
  CHECK(f.registry.get_schema("tool") == first);

  f.dir.write("tool.json", R"({"title":"v2"})");
  touch_forward(file);
  const auto second = f.registry.get_schema("tool");
  REQUIRE(second != nullptr);
  CHECK((*second)["title"] == "v2");
  // The old pointer still holds its own document.
  CHECK((*first)["title"] == "v1");
}

TEST_CASE("SchemaRegistry: a malformed rewrite keeps the previous schema", "[response][schema]") {
  RegistryFixture f;
  const auto file = f.dir.write("tool.json", R"({"title":"good"})");
  REQUIRE(f.registry.get_schema("tool") != nullptr);

  f.dir.write("tool.json", "{broken");
  touch_forward(file);
  const auto schema = f.registry.get_schema("tool");
  REQUIRE(schema != nullptr);
  CHECK((*schema)["title"] == "good");
  CHECK(f.sink.contains_message("schema_malformed"));
}

TEST_CASE("SchemaRegistry: a malformed first load returns nullptr", "[response][schema]") {
  RegistryFixture f;
  f.dir.write("tool.json", "[]");
  CHECK(f.registry.get_schema("tool") == nullptr);
}

TEST_CASE("SchemaRegistry: a deleted file stops being served", "[response][schema]") {
  RegistryFixture f;
  const auto file = f.dir.write("tool.json", R"({"title":"x"})");
  REQUIRE(f.registry.get_schema("tool") != nullptr);
  std::filesystem::remove(file);
  CHECK(f.registry.get_schema("tool") == nullptr);
}

TEST_CASE("SchemaRegistry: list_tools returns sorted schema names", "[response][schema]") {
  RegistryFixture f;
  f.dir.write("zeta.json", "{}");
  f.dir.write("alpha.json", "{}");
  f.dir.write("notes.txt", "ignored");
  f.dir.write("bad name.json", "{}");
  CHECK(f.registry.list_tools() == std::vector<std::string>{"alpha", "zeta"});
}

TEST_CASE("SchemaRegistry: the shipped schemas load", "[response][schema]") {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  logging::InMemoryLogSink sink;
  SchemaRegistry registry{LANCET_SCHEMA_DIR, logging::Logger(sink, clock, "schemas")};
  for (const char* tool : {"error", "feedback", "get_status", "sanitize_preview"}) {
    INFO(tool);
    CHECK(registry.get_schema(tool) != nullptr);
  }
}
