#include "lancet/core/clock.h"
#include "lancet/logging/log_event.h"
#include "lancet/logging/log_sink.h"
#include "lancet/logging/logger.h"
#include "lancet/logging/redaction.h"
#include "lancet/security/secret_markers.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

using namespace lancet;
using namespace lancet::logging;
using nlohmann::json;

// ── Log events ────────────────────────────────────────────────────────────

TEST_CASE("parse_log_level: known names", "[logging]") {
  CHECK(parse_log_level("debug") == LogLevel::kDebug);
  CHECK(parse_log_level("warn") == LogLevel::kWarning);
  CHECK(parse_log_level("warning") == LogLevel::kWarning);
  CHECK_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("to_json(LogEvent): envelope plus flattened fields", "[logging]") {
  LogEvent event;
  event.level = LogLevel::kWarning;
  event.logger = "mcp";
  event.message = "schema_missing";
  event.fields = json{{"tool", "x"}, {"message", "collides"}};
  event.timestamp = "2026-01-01T00:00:00Z";

  const auto j = to_json(event);
  CHECK(j["level"] == "warning");
  CHECK(j["logger"] == "mcp");
  CHECK(j["message"] == "schema_missing");
  CHECK(j["tool"] == "x");
  CHECK(j["fields"]["message"] == "collides");
}

TEST_CASE("Logger: stamps events with name and clock", "[logging]") {
  core::FixedClock clock{"2026-02-03T04:05:06Z"};
  InMemoryLogSink sink;
  const Logger logger(sink, clock, "verifier");

  logger.info("domain_promoted", {{"domain", "a.test"}});
  logger.error("boom");

  const auto events = sink.events();
  REQUIRE(events.size() == 2);
  CHECK(events[0].logger == "verifier");
  CHECK(events[0].timestamp == "2026-02-03T04:05:06Z");
  CHECK(events[0].fields["domain"] == "a.test");
  CHECK(sink.count(LogLevel::kError) == 1);
  CHECK(sink.contains_message("boom"));

  sink.clear();
  CHECK(sink.events().empty());
}

// ── Path masking ──────────────────────────────────────────────────────────

TEST_CASE("mask_paths: absolute, home and drive paths", "[logging][redaction]") {
  CHECK(mask_paths("open /etc/passwd failed").text == "open [PATH] failed");
  CHECK(mask_paths("key at ~/secrets/key.pem").text == "key at [PATH]");
  CHECK(mask_paths("file C:\\Users\\bob\\file.txt").text == "file [PATH]");
  CHECK(mask_paths("read('/srv/app/x.json')").text == "read('[PATH]')");
}

TEST_CASE("mask_paths: leaves ordinary text alone", "[logging][redaction]") {
  const auto ratio = mask_paths("ratio 1/2 and and/or /tmp");
  CHECK(ratio.text == "ratio 1/2 and and/or /tmp");
  CHECK(ratio.redactions == 0);
}

// ── Secret markers ────────────────────────────────────────────────────────

TEST_CASE("mask_secret_markers: tag markup, bare names and rule phrases", "[logging][redaction]") {
  const auto markup = mask_secret_markers("see <LANCET-abcd1234> here");
  CHECK(markup.text == "see [MASKED] here");
  CHECK(markup.redactions == 1);

  CHECK(mask_secret_markers("name LANCET-0123456789abcdef").text == "name [MASKED]");
  CHECK(mask_secret_markers(std::string(security::kRulesHeader)).text == "[MASKED]");
  CHECK(mask_secret_markers("LANCET-ab is short").redactions == 0);
}

TEST_CASE("mask_secret_markers: honors a custom prefix", "[logging][redaction]") {
  CHECK(mask_secret_markers("x <PFX-1234abcd> y", "PFX").text == "x [MASKED] y");
  CHECK(mask_secret_markers("x <PFX-1234abcd> y").redactions == 0);
}

TEST_CASE("mask_secret_markers: long runs of near-matches scan in linear time",
          "[logging][redaction]") {
  std::string prefixes;
  for (int i = 0; i < 40000; ++i) {
    prefixes += "LANCET ";
  }
  const std::string inputs[] = {std::string(400000, '<'), prefixes,
                                std::string(200000, '<') + "LANCET-abcd1234>"};

  const auto started = std::chrono::steady_clock::now();
  CHECK(mask_secret_markers(inputs[0]).redactions == 0);
  CHECK(mask_secret_markers(inputs[1]).redactions == 0);
  const auto tail = mask_secret_markers(inputs[2]);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  CHECK(tail.redactions == 1);
  CHECK(tail.text == std::string(199999, '<') + "[MASKED]");
  CHECK(elapsed < std::chrono::seconds(2));
}

// ── Exception messages ────────────────────────────────────────────────────

TEST_CASE("first_line: stops at the first line break", "[logging][redaction]") {
  CHECK(first_line("one\ntwo") == "one");
  CHECK(first_line("one\r\ntwo") == "one");
  CHECK(first_line("single") == "single");
}

TEST_CASE("sanitize_exception_message: first line, masked and clamped", "[logging][redaction]") {
  const auto multi = sanitize_exception_message("failed at /opt/lancet/bin\ntrace line");
  CHECK(multi.text == "failed at [PATH]");
  CHECK(multi.redactions == 2);

  const auto long_message = sanitize_exception_message(std::string(500, 'e'));
  CHECK(long_message.text.size() == kMaxErrorMessageLength + 3);
  CHECK(long_message.text.substr(long_message.text.size() - 3) == "...");
}

TEST_CASE("sanitize_details: masks nested strings", "[logging][redaction]") {
  const json details{{"file", "/var/lib/x/y.db"},
                     {"nested", {{"prompt", "<LANCET-abcd1234>body"}}},
                     {"list", json::array({"ok", 3})},
                     {"count", 7}};
  const auto out = sanitize_details(details);
  CHECK(out["file"] == "[PATH]");
  CHECK(out["nested"]["prompt"] == "[MASKED:prompt_content]");
  CHECK(out["list"] == json::array({"ok", 3}));
  CHECK(out["count"] == 7);
}

TEST_CASE("describe_exception_type: demangled type name", "[logging][redaction]") {
  CHECK(describe_exception_type(std::runtime_error("x")) == "std::runtime_error");
  CHECK(describe_exception_type(std::invalid_argument("x")) == "std::invalid_argument");
}
