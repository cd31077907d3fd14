#include "sanitize_preview.h"

#include "lancet/response/errors.h"
#include "lancet/security/security_context.h"

#include <string>

namespace lancet::mcp::handlers {

using json = nlohmann::json;

json handle_sanitize_preview(const json& params, ServerContext& ctx) {
  const auto text = params.find("text");
  if (text == params.end() || !text->is_string()) {
    throw response::invalid_params("text is required and must be a string", "text");
  }

  core::SecurityConfig config = ctx.config.security;
  if (const auto it = params.find("max_length"); it != params.end()) {
    const auto limit = config.max_input_length;
    if (!it->is_number_integer() || it->get<long long>() < 1 ||
        static_cast<unsigned long long>(it->get<long long>()) > limit) {
      throw response::invalid_params(
          "max_length must be between 1 and " + std::to_string(limit), "max_length");
    }
    config.max_input_length = static_cast<std::size_t>(it->get<long long>());
  }

  std::string task_id;
  if (const auto it = params.find("task_id"); it != params.end() && it->is_string()) {
    task_id = it->get<std::string>();
  }

  security::LlmSecurityContext security(ctx.secure_log.logger(), config, task_id);
  security.set_audit_logger(&ctx.services.audit);

  const auto sanitized = security.sanitize_input(text->get<std::string>());
  json result{{"ok", true},
              {"sanitized_text", sanitized.sanitized_text},
              {"original_length", sanitized.original_length},
              {"removed_tags", sanitized.removed_tags},
              {"removed_zero_width", sanitized.removed_zero_width},
              {"dangerous_patterns_found", sanitized.dangerous_patterns_found},
              {"had_warnings", sanitized.had_warnings},
              {"was_truncated", sanitized.was_truncated}};

  if (const auto output = params.find("output"); output != params.end()) {
    if (!output->is_string()) {
      throw response::invalid_params("output must be a string", "output");
    }
    const auto checked = security.validate_output(output->get<std::string>());
    result["output_check"] = {{"validated_text", checked.validated_text},
                              {"had_suspicious_content", checked.had_suspicious_content},
                              {"urls_found", checked.urls_found.size()},
                              {"ips_found", checked.ips_found.size()},
                              {"leakage_detected", checked.leakage_detected},
                              {"was_truncated", checked.was_truncated}};
  }

  ctx.secure_log.log_llm_io("sanitize_preview", text->get<std::string>(),
                            sanitized.sanitized_text);
  return result;
}

}  // namespace lancet::mcp::handlers
