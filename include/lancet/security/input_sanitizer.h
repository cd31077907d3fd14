#pragma once

#include "lancet/core/security_config.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::security {

// SanitizationResult is a pure value produced by one sanitize_llm_input call.
// Lengths are in Unicode code points.
struct SanitizationResult {
  std::string sanitized_text;                         // NOLINT(readability-identifier-naming)
  std::size_t original_length{0};                     // NOLINT(readability-identifier-naming)
  std::size_t removed_tags{0};                        // NOLINT(readability-identifier-naming)
  std::size_t removed_zero_width{0};                  // NOLINT(readability-identifier-naming)
  std::vector<std::string> dangerous_patterns_found;  // NOLINT(readability-identifier-naming)
  bool had_warnings{false};                           // NOLINT(readability-identifier-naming)
  bool was_truncated{false};                          // NOLINT(readability-identifier-naming)
};

struct SanitizerOptions {
  std::string tag_prefix{core::kDefaultTagPrefix};          // NOLINT(readability-identifier-naming)
  std::size_t max_length{core::kDefaultMaxInputLength};     // NOLINT(readability-identifier-naming)
};

// Maximum number of normalize/decode/strip passes. Each pass is linear. When the text is still
// changing after the last pass, every remaining '&' and '<' is dropped and the result warns.
inline constexpr int kMaxSanitizePasses = 8;

// sanitize_llm_input prepares untrusted text for inclusion in a prompt:
//   1. NFKC normalization
//   2. HTML entity decoding
//   3. zero-width / bidi control stripping (counted)
//   4. control character stripping (\n \t \r kept)
//   5. session-tag markup removal (counted, warns)
//   6. dangerous instruction pattern detection (recorded, not removed, warns)
//   7. clamp to options.max_length code points
// Steps 1-5 repeat until the text stops changing, so sanitizing the output again removes
// nothing further. Never throws for any input.
[[nodiscard]] SanitizationResult sanitize_llm_input(std::string_view text,
                                                    const SanitizerOptions& options = {});

// is_zero_width reports whether cp is stripped by step 3.
[[nodiscard]] bool is_zero_width(char32_t cp);

// detect_dangerous_patterns returns the labels of every instruction-override phrase found in
// text, once each, in a fixed order. Case-insensitive for ASCII; whitespace runs match any
// amount of whitespace.
[[nodiscard]] std::vector<std::string> detect_dangerous_patterns(std::u32string_view text);
[[nodiscard]] std::vector<std::string> detect_dangerous_patterns(std::string_view text);

}  // namespace lancet::security
