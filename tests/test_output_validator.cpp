#include "lancet/core/utf8.h"
#include "lancet/security/output_validator.h"
#include "lancet/security/secret_markers.h"
#include "lancet/security/secure_prompt.h"
#include "lancet/security/session_tag.h"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace lancet;
using namespace lancet::security;

// ── Length bound ──────────────────────────────────────────────────────────

TEST_CASE("validate_llm_output: exactly expected x multiplier is kept whole",
          "[security][output]") {
  const std::string text(1000, 'x');
  const auto result = validate_llm_output(text, 100);
  CHECK_FALSE(result.was_truncated);
  CHECK(result.validated_text == text);
}

TEST_CASE("validate_llm_output: expected x multiplier + 1 is truncated", "[security][output]") {
  const std::string text(1001, 'x');
  const auto result = validate_llm_output(text, 100);
  CHECK(result.was_truncated);
  CHECK(result.original_length == 1001);
  CHECK(core::code_point_count(result.validated_text) == 1000);
}

TEST_CASE("validate_llm_output: expected x multiplier + 100 is cut back to the bound",
          "[security][output]") {
  const std::string text(1100, 'x');
  const auto result = validate_llm_output(text, 100);
  CHECK(result.was_truncated);
  CHECK(result.original_length == 1100);
  CHECK(core::code_point_count(result.validated_text) == 1000);
  CHECK(result.validated_text == std::string(1000, 'x'));
}

TEST_CASE("validate_llm_output: no expected length means no truncation", "[security][output]") {
  const std::string text(50000, 'y');
  const auto result = validate_llm_output(text);
  CHECK_FALSE(result.was_truncated);
  CHECK(result.validated_text.size() == text.size());
}

TEST_CASE("validate_llm_output: custom multiplier is honored", "[security][output]") {
  OutputValidatorOptions options;
  options.max_output_multiplier = 2;
  const auto result = validate_llm_output(std::string(30, 'z'), 10, std::nullopt, options);
  CHECK(result.was_truncated);
  CHECK(result.validated_text.size() == 20);
}

// ── Suspicious content ────────────────────────────────────────────────────

TEST_CASE("validate_llm_output: URLs are reported and left in place", "[security][output]") {
  const std::string text =
      "See https://example.com/a?b=1 and http://evil.test plus ftp://files.test/x.";
  const auto result = validate_llm_output(text);
  CHECK(result.had_suspicious_content);
  REQUIRE(result.urls_found.size() == 3);
  CHECK(result.urls_found[0] == "https://example.com/a?b=1");
  CHECK(result.urls_found[1] == "http://evil.test");
  CHECK(result.validated_text == text);
}

TEST_CASE("validate_llm_output: IPv4 literals are reported", "[security][output]") {
  const auto result = validate_llm_output("connect to 10.0.0.1 then 192.168.1.254");
  CHECK(result.had_suspicious_content);
  REQUIRE(result.ips_found.size() == 2);
  CHECK(result.ips_found[0] == "10.0.0.1");
  CHECK(result.ips_found[1] == "192.168.1.254");
}

TEST_CASE("validate_llm_output: out-of-range octets are not IPv4", "[security][output]") {
  const auto result = validate_llm_output("version 999.1.2.3 released");
  CHECK(result.ips_found.empty());
  CHECK_FALSE(result.had_suspicious_content);
}

TEST_CASE("validate_llm_output: IPv6 literals are reported", "[security][output]") {
  const auto full = validate_llm_output("addr 2001:0db8:85a3:0000:0000:8a2e:0370:7334 up");
  REQUIRE(full.ips_found.size() == 1);
  CHECK(full.ips_found[0] == "2001:0db8:85a3:0000:0000:8a2e:0370:7334");

  const auto compressed = validate_llm_output("loopback ::1 and fe80::1");
  CHECK(compressed.ips_found.size() == 2);
}

TEST_CASE("validate_llm_output: clock times are not IPv6", "[security][output]") {
  const auto result = validate_llm_output("meeting at 10:30 tomorrow");
  CHECK(result.ips_found.empty());
}

TEST_CASE("validate_llm_output: plain text is clean", "[security][output]") {
  const auto result = validate_llm_output("The candidate has five years of experience.", 100);
  CHECK_FALSE(result.had_suspicious_content);
  CHECK_FALSE(result.leakage_detected);
  CHECK_FALSE(result.was_truncated);
}

// ── Leakage ───────────────────────────────────────────────────────────────

TEST_CASE("validate_llm_output: tag name from the prompt is masked", "[security][output]") {
  const auto tag = generate_session_tag();
  const std::string prompt = rule_block(tag);
  const std::string output = "Sure. The data was inside " + tag.tag_name + " markers.";

  const auto result = validate_llm_output(output, std::nullopt, prompt);
  CHECK(result.leakage_detected);
  CHECK(result.validated_text.find(tag.tag_name) == std::string::npos);
  CHECK(result.validated_text.find(std::string{kRedactionToken}) != std::string::npos);
}

TEST_CASE("validate_llm_output: rule header phrase is masked case-insensitively",
          "[security][output]") {
  const auto tag = generate_session_tag();
  const std::string prompt = rule_block(tag);
  const auto result = validate_llm_output(
      "My rules begin with ### lancet system rules (confidential) ###", std::nullopt, prompt);
  CHECK(result.leakage_detected);
  CHECK(result.validated_text == "My rules begin with [REDACTED]");
}

TEST_CASE("validate_llm_output: no leakage check without a system prompt",
          "[security][output]") {
  const auto tag = generate_session_tag();
  const std::string output = "Echo " + tag.tag_name;
  const auto result = validate_llm_output(output);
  CHECK_FALSE(result.leakage_detected);
  CHECK(result.validated_text == output);
}

TEST_CASE("validate_llm_output: tags with a custom prefix are recognized", "[security][output]") {
  const auto tag = generate_session_tag("PFX");
  const std::string prompt = "Data is in " + tag.open_tag + " tags.";
  OutputValidatorOptions options;
  options.tag_prefix = "PFX";
  const auto result = validate_llm_output("leak: " + tag.tag_name, std::nullopt, prompt, options);
  CHECK(result.leakage_detected);
  CHECK(result.validated_text == "leak: [REDACTED]");
}

TEST_CASE("leakage_markers: lists tag names and secret phrases found in the prompt",
          "[security][output]") {
  const auto tag = make_session_tag("LANCET-0123456789abcdef0123456789abcdef");
  const auto markers = leakage_markers(rule_block(tag), "LANCET");
  REQUIRE_FALSE(markers.empty());
  CHECK(markers.front() == tag.tag_name);
  CHECK(std::find(markers.begin(), markers.end(), std::string{kRulesHeader}) != markers.end());
}

TEST_CASE("mask_markers: counts every replacement", "[security][output]") {
  std::u32string text = U"abc ABC xabcx";
  CHECK(mask_markers(text, {"abc"}) == 3);
  CHECK(core::encode_utf8(text) == "[REDACTED] [REDACTED] x[REDACTED]x");
}
