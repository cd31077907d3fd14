#pragma once

#include "lancet/core/security_config.h"
#include "lancet/llm/provider.h"
#include "lancet/logging/audit_logger.h"
#include "lancet/logging/logger.h"
#include "lancet/security/input_sanitizer.h"
#include "lancet/security/output_validator.h"
#include "lancet/security/secure_prompt.h"
#include "lancet/security/session_tag.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace lancet::security {

struct SecurityContextStats {
  std::string tag_id;                       // NOLINT(readability-identifier-naming)
  std::size_t sanitization_count{0};        // NOLINT(readability-identifier-naming)
  std::size_t validation_count{0};          // NOLINT(readability-identifier-naming)
  std::size_t dangerous_pattern_count{0};   // NOLINT(readability-identifier-naming)
  std::size_t suspicious_output_count{0};   // NOLINT(readability-identifier-naming)
  std::size_t leakage_count{0};             // NOLINT(readability-identifier-naming)
};

[[nodiscard]] nlohmann::json to_json(const SecurityContextStats& stats);

struct SecureGeneration {
  llm::LlmResponse response;                         // NOLINT(readability-identifier-naming)
  std::optional<SanitizationResult> sanitization;    // NOLINT(readability-identifier-naming)
  std::optional<OutputValidationResult> validation;  // NOLINT(readability-identifier-naming)

  // text returns the validated output, or "" when the call failed.
  [[nodiscard]] std::string text() const {
    return validation.has_value() ? validation->validated_text : std::string{};
  }
};

// LlmSecurityContext scopes one session tag to one task. Construction generates the tag and
// destruction logs the counters. Safe to share between threads of the same task.
class LlmSecurityContext {
 public:
  LlmSecurityContext(logging::Logger logger, core::SecurityConfig config = {},
                     std::string task_id = "");
  ~LlmSecurityContext();

  LlmSecurityContext(const LlmSecurityContext&) = delete;
  LlmSecurityContext& operator=(const LlmSecurityContext&) = delete;
  LlmSecurityContext(LlmSecurityContext&&) = delete;
  LlmSecurityContext& operator=(LlmSecurityContext&&) = delete;

  // Dangerous patterns and leakage are journaled when set.
  void set_audit_logger(const logging::AuditLogger* audit) { audit_ = audit; }

  [[nodiscard]] const SessionTag& tag() const { return tag_; }
  [[nodiscard]] const std::string& tag_id() const { return tag_.tag_id; }

  SanitizationResult sanitize_input(std::string_view text);

  // build_prompt sanitizes user_input and wraps it in this context's tag.
  SecurePromptBuild build_prompt(std::string_view system_instructions,
                                 std::string_view user_input);

  // validate_output checks text against system_prompt, or against this context's rule block
  // when none is given, so an echoed tag is always caught.
  OutputValidationResult validate_output(
      std::string_view text, std::optional<std::size_t> expected_max_length = std::nullopt,
      std::optional<std::string_view> system_prompt = std::nullopt);

  // generate runs the whole round trip: sanitize, build, flatten, call the provider, validate
  // the output against the flattened prompt. Provider exceptions propagate.
  SecureGeneration generate(llm::ILlmProvider& provider, std::string_view system_instructions,
                            std::string_view user_input, const llm::LlmOptions& options = {},
                            std::optional<std::size_t> expected_max_length = std::nullopt);

  [[nodiscard]] SecurityContextStats stats() const;

 private:
  logging::Logger logger_;
  core::SecurityConfig config_;
  std::string task_id_;
  SessionTag tag_;
  const logging::AuditLogger* audit_{nullptr};

  std::atomic<std::size_t> sanitization_count_{0};
  std::atomic<std::size_t> validation_count_{0};
  std::atomic<std::size_t> dangerous_pattern_count_{0};
  std::atomic<std::size_t> suspicious_output_count_{0};
  std::atomic<std::size_t> leakage_count_{0};
};

}  // namespace lancet::security
