#include "lancet/security/security_context.h"

namespace lancet::security {

nlohmann::json to_json(const SecurityContextStats& stats) {
  return nlohmann::json{{"tag_id", stats.tag_id},
                        {"sanitization_count", stats.sanitization_count},
                        {"validation_count", stats.validation_count},
                        {"dangerous_pattern_count", stats.dangerous_pattern_count},
                        {"suspicious_output_count", stats.suspicious_output_count},
                        {"leakage_count", stats.leakage_count}};
}

LlmSecurityContext::LlmSecurityContext(logging::Logger logger, core::SecurityConfig config,
                                       std::string task_id)
    : logger_(std::move(logger)),
      config_(std::move(config)),
      task_id_(std::move(task_id)),
      tag_(generate_session_tag(config_.tag_prefix)) {
  logger_.info("llm_security_context_started", {{"tag_id", tag_.tag_id}, {"task_id", task_id_}});
}

LlmSecurityContext::~LlmSecurityContext() {
  logger_.info("llm_security_context_ended", to_json(stats()));
}

SanitizationResult LlmSecurityContext::sanitize_input(std::string_view text) {
  auto result = sanitize_llm_input(text, SanitizerOptions{config_.tag_prefix, config_.max_input_length});
  ++sanitization_count_;
  if (!result.dangerous_patterns_found.empty()) {
    dangerous_pattern_count_ += result.dangerous_patterns_found.size();
    if (audit_ != nullptr) {
      audit_->log_dangerous_pattern(result.dangerous_patterns_found, "llm_input", task_id_);
    }
  }
  return result;
}

SecurePromptBuild LlmSecurityContext::build_prompt(std::string_view system_instructions,
                                                   std::string_view user_input) {
  const auto sanitized = sanitize_input(user_input);
  // Already sanitized above; build without a second pass so the counters stay exact.
  auto build = build_secure_prompt(system_instructions, sanitized.sanitized_text, tag_, false);
  build.sanitization = sanitized;
  return build;
}

OutputValidationResult LlmSecurityContext::validate_output(
    std::string_view text, std::optional<std::size_t> expected_max_length,
    std::optional<std::string_view> system_prompt) {
  const std::string own_rules = rule_block(tag_);
  const std::string_view prompt = system_prompt.has_value() ? *system_prompt : own_rules;

  auto result = validate_llm_output(
      text, expected_max_length, prompt,
      OutputValidatorOptions{config_.tag_prefix, config_.max_output_multiplier});
  ++validation_count_;
  if (result.had_suspicious_content) {
    ++suspicious_output_count_;
  }
  if (result.leakage_detected) {
    ++leakage_count_;
    logger_.warning("llm_output_leakage", {{"tag_id", tag_.tag_id}, {"task_id", task_id_}});
    if (audit_ != nullptr) {
      audit_->log_prompt_leakage(leakage_markers(prompt, config_.tag_prefix), "llm_output",
                                 task_id_);
    }
  }
  return result;
}

SecureGeneration LlmSecurityContext::generate(llm::ILlmProvider& provider,
                                              std::string_view system_instructions,
                                              std::string_view user_input,
                                              const llm::LlmOptions& options,
                                              std::optional<std::size_t> expected_max_length) {
  auto build = build_prompt(system_instructions, user_input);
  const std::string prompt = build.prompt.flatten();

  SecureGeneration out{provider.generate(prompt, options), std::move(build.sanitization),
                       std::nullopt};
  if (!out.response.ok()) {
    logger_.warning("llm_generate_failed", {{"tag_id", tag_.tag_id},
                                            {"provider", out.response.provider},
                                            {"status", static_cast<int>(out.response.status)}});
    return out;
  }
  out.validation = validate_output(out.response.text, expected_max_length, prompt);
  return out;
}

SecurityContextStats LlmSecurityContext::stats() const {
  return SecurityContextStats{tag_.tag_id,
                              sanitization_count_.load(),
                              validation_count_.load(),
                              dangerous_pattern_count_.load(),
                              suspicious_output_count_.load(),
                              leakage_count_.load()};
}

}  // namespace lancet::security
