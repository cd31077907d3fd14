#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/core/sha256.h"
#include "lancet/core/utf8.h"
#include "lancet/logging/log_sink.h"
#include "lancet/logging/secure_logger.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace lancet;
using namespace lancet::logging;

namespace {

struct SecureLoggerFixture {
  core::FixedClock clock{"2026-01-01T00:00:00Z"};
  core::DeterministicIdGenerator ids;
  InMemoryLogSink sink;
  SecureLogger log{Logger(sink, clock, "secure"), ids};

  [[nodiscard]] std::string dump_all() const {
    std::string out;
    for (const auto& event : sink.events()) {
      out += to_json(event).dump();
    }
    return out;
  }
};

}  // namespace

TEST_CASE("summarize_text: hash, code point length and preview", "[logging][secure]") {
  const auto summary = summarize_text("日本語テキスト");
  CHECK(summary.content_hash.size() == kContentHashLength);
  CHECK(summary.content_hash == core::sha256_prefix("日本語テキスト", kContentHashLength));
  CHECK(summary.length == 7);
  CHECK(summary.preview == "日本語テキスト");
  CHECK_FALSE(summary.had_sensitive);
}

TEST_CASE("summarize_text: long text preview is clamped", "[logging][secure]") {
  const std::string text(500, 'a');
  const auto summary = summarize_text(text);
  CHECK(summary.length == 500);
  CHECK(core::code_point_count(summary.preview) <= core::kMaxPreviewLength + 3);
  CHECK(summary.preview.substr(summary.preview.size() - 3) == "...");
}

TEST_CASE("summarize_text: sensitive content is masked in the preview", "[logging][secure]") {
  const auto summary = summarize_text("data <LANCET-abcd1234> from /home/user/file.txt");
  CHECK(summary.had_sensitive);
  CHECK(summary.preview == "data [MASKED] from [PATH]");
}

TEST_CASE("SecureLogger: log_llm_io logs summaries of both sides", "[logging][secure]") {
  SecureLoggerFixture f;
  f.log.log_llm_io("summarize", std::string_view{"confidential prompt body"},
                   std::string_view{"model answer"});

  REQUIRE(f.sink.contains_message("llm_io"));
  const auto events = f.sink.events();
  CHECK(events[0].fields["operation"] == "summarize");
  CHECK(events[0].fields["input"]["length"] == 24);
  CHECK(events[0].fields["output"]["content_hash"] ==
        core::sha256_prefix("model answer", kContentHashLength));
  CHECK(events[0].fields["input"]["preview"] == "confidential prompt body");
}

TEST_CASE("SecureLogger: log_llm_io omits absent sides", "[logging][secure]") {
  SecureLoggerFixture f;
  f.log.log_llm_io("classify", std::nullopt, std::string_view{"out"});
  const auto events = f.sink.events();
  REQUIRE(events.size() == 1);
  CHECK_FALSE(events[0].fields.contains("input"));
  CHECK(events[0].fields.contains("output"));
}

TEST_CASE("SecureLogger: log_exception generates an id and masks the message",
          "[logging][secure]") {
  SecureLoggerFixture f;
  const auto logged =
      f.log.log_exception(std::runtime_error("cannot read /etc/lancet/keys.json\nstack"));
  CHECK(logged.error_id == "err_0000000000000001");
  CHECK(logged.error_type == "std::runtime_error");
  CHECK(logged.message == "cannot read [PATH]");
  CHECK(f.sink.count(LogLevel::kError) == 1);
  CHECK(f.dump_all().find("/etc/lancet") == std::string::npos);
}

TEST_CASE("SecureLogger: log_exception keeps a caller-supplied id", "[logging][secure]") {
  SecureLoggerFixture f;
  const auto logged = f.log.log_exception(std::logic_error("x"), std::string{"err_custom"});
  CHECK(logged.error_id == "err_custom");
}

TEST_CASE("SecureLogger: log_sensitive_operation sanitizes details", "[logging][secure]") {
  SecureLoggerFixture f;
  f.log.log_sensitive_operation("domain_block", {{"reason", "<LANCET-abcd1234>"},
                                                 {"domain", "evil.test"}});
  const auto events = f.sink.events();
  REQUIRE(events.size() == 1);
  CHECK(events[0].fields["details"]["reason"] == "[MASKED:prompt_content]");
  CHECK(events[0].fields["details"]["domain"] == "evil.test");
}
