#pragma once

#include "lancet/security/input_sanitizer.h"
#include "lancet/security/session_tag.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::security {

enum class SegmentKind {
  kTrustedInstruction,
  kUntrustedPayload,
};

struct PromptSegment {
  SegmentKind kind{SegmentKind::kTrustedInstruction};  // NOLINT(readability-identifier-naming)
  std::string text;                                    // NOLINT(readability-identifier-naming)
};

// SecurePrompt keeps trusted instructions and untrusted payload apart until the model call.
// There is no implicit conversion to std::string; flatten() is the only way to get text, and it
// always wraps every untrusted segment in the session tag.
class SecurePrompt {
 public:
  SecurePrompt(SessionTag tag, std::vector<PromptSegment> segments)
      : tag_(std::move(tag)), segments_(std::move(segments)) {}

  [[nodiscard]] const SessionTag& tag() const { return tag_; }
  [[nodiscard]] const std::vector<PromptSegment>& segments() const { return segments_; }

  // flatten renders the single string sent to the model.
  [[nodiscard]] std::string flatten() const;

 private:
  SessionTag tag_;
  std::vector<PromptSegment> segments_;
};

struct SecurePromptBuild {
  SecurePrompt prompt;                             // NOLINT(readability-identifier-naming)
  std::optional<SanitizationResult> sanitization;  // NOLINT(readability-identifier-naming)
};

// rule_block returns the fixed rule text that precedes the task instructions.
[[nodiscard]] std::string rule_block(const SessionTag& tag);

// build_secure_prompt composes rule block + system_instructions + tagged user_input.
// When sanitize_input is true, user_input passes through sanitize_llm_input first and the
// result is returned alongside the prompt. Pure; no side effects.
[[nodiscard]] SecurePromptBuild build_secure_prompt(std::string_view system_instructions,
                                                    std::string_view user_input,
                                                    const SessionTag& tag,
                                                    bool sanitize_input = true,
                                                    const SanitizerOptions& options = {});

}  // namespace lancet::security
