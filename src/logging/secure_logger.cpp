#include "lancet/logging/secure_logger.h"

#include "lancet/core/sha256.h"
#include "lancet/core/utf8.h"
#include "lancet/logging/redaction.h"

namespace lancet::logging {

namespace {

std::string rstrip(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' ||
                        s.back() == '\r')) {
    s.pop_back();
  }
  return s;
}

}  // namespace

TextSummary summarize_text(const std::string_view text, const std::size_t max_preview,
                           const std::string_view tag_prefix) {
  TextSummary summary;
  summary.content_hash = core::sha256_prefix(text, kContentHashLength);
  summary.length = core::code_point_count(text);

  Redacted markers = mask_secret_markers(text, tag_prefix);
  Redacted paths = mask_paths(markers.text);
  summary.had_sensitive = markers.redactions > 0 || paths.redactions > 0;

  if (core::code_point_count(paths.text) > max_preview) {
    summary.preview = rstrip(core::truncate_code_points(paths.text, max_preview)) + "...";
  } else {
    summary.preview = std::move(paths.text);
  }
  return summary;
}

nlohmann::json to_json(const TextSummary& summary) {
  return nlohmann::json{{"content_hash", summary.content_hash},
                        {"length", summary.length},
                        {"preview", summary.preview},
                        {"had_sensitive", summary.had_sensitive}};
}

SecureLogger::SecureLogger(Logger logger, core::IIdGenerator& id_gen, SecureLoggerOptions options)
    : logger_(std::move(logger)), id_gen_(&id_gen), options_(std::move(options)) {}

void SecureLogger::log_llm_io(const std::string_view operation,
                              const std::optional<std::string_view> input,
                              const std::optional<std::string_view> output) const {
  nlohmann::json fields{{"operation", std::string{operation}}};
  if (input.has_value()) {
    fields["input"] = to_json(summarize_text(*input, options_.max_preview, options_.tag_prefix));
  }
  if (output.has_value()) {
    fields["output"] = to_json(summarize_text(*output, options_.max_preview, options_.tag_prefix));
  }
  logger_.info("llm_io", std::move(fields));
}

SanitizedException SecureLogger::log_exception(const std::exception& e,
                                               std::optional<std::string> error_id) const {
  SanitizedException out;
  out.error_type = describe_exception_type(e);
  out.message = sanitize_exception_message(e.what(), options_.tag_prefix).text;
  out.error_id = error_id.has_value() ? std::move(*error_id) : id_gen_->next("err");

  logger_.error("exception", {{"error_type", out.error_type},
                              {"error_message", out.message},
                              {"error_id", out.error_id}});
  return out;
}

void SecureLogger::log_sensitive_operation(const std::string_view operation,
                                           const nlohmann::json& details) const {
  logger_.info("sensitive_operation",
               {{"operation", std::string{operation}},
                {"details", sanitize_details(details, options_.tag_prefix)}});
}

}  // namespace lancet::logging
