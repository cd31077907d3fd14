#pragma once

#include "lancet/core/id_generator.h"
#include "lancet/core/security_config.h"
#include "lancet/logging/logger.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace lancet::logging {

inline constexpr std::size_t kContentHashLength = 16;

// TextSummary stands in for prompt or model text in logs. The text itself is never logged.
struct TextSummary {
  std::string content_hash;   // NOLINT(readability-identifier-naming)
  std::size_t length{0};      // NOLINT(readability-identifier-naming)
  std::string preview;        // NOLINT(readability-identifier-naming)
  bool had_sensitive{false};  // NOLINT(readability-identifier-naming)
};

// summarize_text hashes the text (first 16 hex of SHA-256), counts code points and builds a
// preview: secret markers become [MASKED], paths become [PATH], then the result is clamped to
// max_preview code points with "..." appended.
[[nodiscard]] TextSummary summarize_text(std::string_view text,
                                         std::size_t max_preview = core::kMaxPreviewLength,
                                         std::string_view tag_prefix = core::kDefaultTagPrefix);

[[nodiscard]] nlohmann::json to_json(const TextSummary& summary);

struct SanitizedException {
  std::string error_type;  // NOLINT(readability-identifier-naming)
  std::string message;     // NOLINT(readability-identifier-naming)
  std::string error_id;    // NOLINT(readability-identifier-naming)
};

struct SecureLoggerOptions {
  std::string tag_prefix{core::kDefaultTagPrefix};     // NOLINT(readability-identifier-naming)
  std::size_t max_preview{core::kMaxPreviewLength};    // NOLINT(readability-identifier-naming)
};

// SecureLogger writes LLM traffic and failures to the operational log without leaking prompt
// content, session tags or filesystem layout.
class SecureLogger {
 public:
  SecureLogger(Logger logger, core::IIdGenerator& id_gen, SecureLoggerOptions options = {});

  void log_llm_io(std::string_view operation, std::optional<std::string_view> input,
                  std::optional<std::string_view> output) const;

  // log_exception logs type, sanitized first line and correlation id. A missing error_id is
  // generated ("err_" + 16 hex). Returns what was logged.
  SanitizedException log_exception(const std::exception& e,
                                    std::optional<std::string> error_id = std::nullopt) const;

  // log_sensitive_operation logs details after sanitize_details.
  void log_sensitive_operation(std::string_view operation, const nlohmann::json& details) const;

  [[nodiscard]] const Logger& logger() const { return logger_; }

 private:
  Logger logger_;
  core::IIdGenerator* id_gen_;
  SecureLoggerOptions options_;
};

}  // namespace lancet::logging
