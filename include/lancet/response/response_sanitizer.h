#pragma once

#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/core/security_config.h"
#include "lancet/logging/audit_logger.h"
#include "lancet/logging/logger.h"
#include "lancet/logging/redaction.h"
#include "lancet/response/schema_registry.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lancet::response {

inline constexpr const char* kGenericErrorMessage =
    "An internal error occurred. Check logs for error_id.";
// More redactions than this in one error message and the message is replaced wholesale.
inline constexpr std::size_t kMaxErrorRedactions = 3;
// Schema property annotation marking model-generated text.
inline constexpr const char* kLlmGeneratedKeyword = "x-llm-generated";

struct SanitizationStats {
  std::size_t fields_removed{0};        // NOLINT(readability-identifier-naming)
  std::size_t fields_sanitized{0};      // NOLINT(readability-identifier-naming)
  std::size_t llm_fields_processed{0};  // NOLINT(readability-identifier-naming)
  std::size_t leakage_detected{0};      // NOLINT(readability-identifier-naming)
  std::size_t errors_sanitized{0};      // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool had_modifications() const {
    return fields_removed > 0 || fields_sanitized > 0 || leakage_detected > 0;
  }

  SanitizationStats& operator+=(const SanitizationStats& other);
};

[[nodiscard]] nlohmann::json to_json(const SanitizationStats& stats);

struct ResponseSanitization {
  nlohmann::json response;  // NOLINT(readability-identifier-naming)
  SanitizationStats stats;  // NOLINT(readability-identifier-naming)
  bool schema_found{false};  // NOLINT(readability-identifier-naming)
};

struct ResponseSanitizerOptions {
  std::string tag_prefix{core::kDefaultTagPrefix};                 // NOLINT(readability-identifier-naming)
  std::size_t max_error_length{logging::kMaxErrorMessageLength};   // NOLINT(readability-identifier-naming)
};

// ResponseSanitizer is the last gate before a tool result leaves the process.
//
// sanitize_response applies the tool's schema as an allowlist: object keys absent from
// "properties" are dropped, recursing through nested objects, array "items" and "oneOf" variants
// (a variant matches when its "required" keys are present and every "const" property agrees;
// otherwise the first variant applies). The metadata key always passes. String properties
// annotated "x-llm-generated" are re-validated against system_prompt; leaked markers are
// masked and a prompt_leakage warning is appended to the response metadata.
//
// A missing or malformed schema logs a warning and passes the response through.
class ResponseSanitizer {
 public:
  ResponseSanitizer(SchemaRegistry& schemas, logging::Logger logger, core::IIdGenerator& id_gen,
                    core::IClock& clock, ResponseSanitizerOptions options = {})
      : schemas_(&schemas),
        logger_(std::move(logger)),
        id_gen_(&id_gen),
        clock_(&clock),
        options_(std::move(options)) {}

  // Security events (unknown fields, leakage, sanitized errors) are journaled when set.
  void set_audit_logger(const logging::AuditLogger* audit) { audit_ = audit; }

  [[nodiscard]] ResponseSanitization sanitize_response(
      const nlohmann::json& response, const std::string& tool_name,
      std::optional<std::string_view> system_prompt = std::nullopt,
      const std::string& task_id = "");

  // sanitize_error renders an exception as {ok:false, error_code, error, error_id}. The message
  // keeps only its first line, with paths and secret markers masked, clamped to
  // max_error_length. McpToolError keeps its code and details; anything else is INTERNAL_ERROR.
  // The payload is filtered through the "error" schema when one is installed.
  [[nodiscard]] nlohmann::json sanitize_error(const std::exception& e,
                                              std::optional<std::string> error_id = std::nullopt);

  // Totals across every call since construction or reset_stats().
  [[nodiscard]] SanitizationStats stats() const;
  void reset_stats();

 private:
  SchemaRegistry* schemas_;
  logging::Logger logger_;
  core::IIdGenerator* id_gen_;
  core::IClock* clock_;
  ResponseSanitizerOptions options_;
  const logging::AuditLogger* audit_{nullptr};

  mutable std::mutex stats_mutex_;
  SanitizationStats totals_;

  void record(const SanitizationStats& stats);
};

}  // namespace lancet::response
