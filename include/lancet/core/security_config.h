#pragma once

#include <cstddef>
#include <string>

namespace lancet::core {

// Defaults for the LLM security pipeline.
inline constexpr const char* kDefaultTagPrefix = "LANCET";
inline constexpr std::size_t kDefaultMaxInputLength = 4000;
inline constexpr std::size_t kMaxOutputMultiplier = 10;
inline constexpr std::size_t kMaxPreviewLength = 100;
inline constexpr int kMinIndependentSourcesForPromotion = 2;
inline constexpr double kMaxRejectionRateBeforeBlock = 0.3;

// SecurityConfig carries the tunables of the pipeline. Every field has a working default.
struct SecurityConfig {
  std::string tag_prefix{kDefaultTagPrefix};                     // NOLINT(readability-identifier-naming)
  std::size_t max_input_length{kDefaultMaxInputLength};          // NOLINT(readability-identifier-naming)
  std::size_t max_output_multiplier{kMaxOutputMultiplier};       // NOLINT(readability-identifier-naming)
  std::size_t max_preview_length{kMaxPreviewLength};             // NOLINT(readability-identifier-naming)
  int min_independent_sources{kMinIndependentSourcesForPromotion};  // NOLINT(readability-identifier-naming)
  double max_rejection_rate{kMaxRejectionRateBeforeBlock};       // NOLINT(readability-identifier-naming)
};

// validate_security_config returns "" when config is usable, otherwise a one-line reason.
// The tag prefix must be 1-32 characters of [A-Za-z0-9]; the separator and hex suffix are added
// by the tag generator.
[[nodiscard]] std::string validate_security_config(const SecurityConfig& config);

}  // namespace lancet::core
