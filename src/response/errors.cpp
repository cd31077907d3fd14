#include "lancet/response/errors.h"

namespace lancet::response {

const char* to_string(McpErrorCode code) {
  switch (code) {
    case McpErrorCode::kInvalidParams:
      return "INVALID_PARAMS";
    case McpErrorCode::kTaskNotFound:
      return "TASK_NOT_FOUND";
    case McpErrorCode::kBudgetExhausted:
      return "BUDGET_EXHAUSTED";
    case McpErrorCode::kAuthRequired:
      return "AUTH_REQUIRED";
    case McpErrorCode::kAllEnginesBlocked:
      return "ALL_ENGINES_BLOCKED";
    case McpErrorCode::kPipelineError:
      return "PIPELINE_ERROR";
    case McpErrorCode::kCalibrationError:
      return "CALIBRATION_ERROR";
    case McpErrorCode::kTimeout:
      return "TIMEOUT";
    case McpErrorCode::kChromeNotReady:
      return "CHROME_NOT_READY";
    case McpErrorCode::kInternalError:
      return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

nlohmann::json McpToolError::to_json(const std::optional<std::string>& error_id) const {
  nlohmann::json j{{"ok", false}, {"error_code", to_string(code_)}, {"error", what()}};
  if (error_id.has_value()) {
    j["error_id"] = *error_id;
  }
  if (details_.is_object() && !details_.empty()) {
    j["details"] = details_;
  }
  return j;
}

McpToolError invalid_params(const std::string& message, const std::string& param) {
  nlohmann::json details = nlohmann::json::object();
  if (!param.empty()) {
    details["param_name"] = param;
  }
  return McpToolError(McpErrorCode::kInvalidParams, message, std::move(details));
}

}  // namespace lancet::response
