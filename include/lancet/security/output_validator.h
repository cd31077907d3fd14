#pragma once

#include "lancet/core/security_config.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::security {

struct OutputValidationResult {
  std::string validated_text;           // NOLINT(readability-identifier-naming)
  std::size_t original_length{0};       // NOLINT(readability-identifier-naming)
  bool had_suspicious_content{false};   // NOLINT(readability-identifier-naming)
  std::vector<std::string> urls_found;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> ips_found;   // NOLINT(readability-identifier-naming)
  bool leakage_detected{false};         // NOLINT(readability-identifier-naming)
  bool was_truncated{false};            // NOLINT(readability-identifier-naming)
};

struct OutputValidatorOptions {
  std::string tag_prefix{core::kDefaultTagPrefix};                // NOLINT(readability-identifier-naming)
  std::size_t max_output_multiplier{core::kMaxOutputMultiplier};  // NOLINT(readability-identifier-naming)
};

// validate_llm_output inspects model output after generation:
//   1. URL (http/https/ftp) and IPv4/IPv6 literals set had_suspicious_content.
//   2. With a system_prompt, every session-tag name the prompt carries and every rule-block
//      marker phrase it contains is masked in the output with kRedactionToken.
//   3. Output longer than expected_max_length * multiplier code points is truncated to that bound.
// Never throws for any input.
[[nodiscard]] OutputValidationResult validate_llm_output(
    std::string_view text, std::optional<std::size_t> expected_max_length = std::nullopt,
    std::optional<std::string_view> system_prompt = std::nullopt,
    const OutputValidatorOptions& options = {});

// Scanners exposed for reuse; results are deduplicated in first-seen order.
[[nodiscard]] std::vector<std::string> find_urls(std::u32string_view text);
[[nodiscard]] std::vector<std::string> find_ip_literals(std::u32string_view text);

// leakage_markers returns the strings whose reappearance in output counts as leakage for the
// given system prompt.
[[nodiscard]] std::vector<std::string> leakage_markers(std::string_view system_prompt,
                                                       std::string_view tag_prefix);

// mask_markers replaces every case-insensitive occurrence of each marker in text with
// kRedactionToken and returns the number of replacements.
std::size_t mask_markers(std::u32string& text, const std::vector<std::string>& markers);

}  // namespace lancet::security
