#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace lancet::response {

// Error codes returned to the MCP client in {"ok": false, "error_code": ...} payloads.
enum class McpErrorCode {
  kInvalidParams,
  kTaskNotFound,
  kBudgetExhausted,
  kAuthRequired,
  kAllEnginesBlocked,
  kPipelineError,
  kCalibrationError,
  kTimeout,
  kChromeNotReady,
  kInternalError,
};

[[nodiscard]] const char* to_string(McpErrorCode code);

// McpToolError is thrown by tool handlers for failures the client can act on. The message is
// sent verbatim, so it must not carry internal detail.
class McpToolError : public std::runtime_error {
 public:
  McpToolError(McpErrorCode code, const std::string& message,
               nlohmann::json details = nlohmann::json::object())
      : std::runtime_error(message), code_(code), details_(std::move(details)) {}

  [[nodiscard]] McpErrorCode code() const { return code_; }
  [[nodiscard]] const nlohmann::json& details() const { return details_; }

  // to_json renders {ok:false, error_code, error, error_id?, details?}.
  [[nodiscard]] nlohmann::json to_json(const std::optional<std::string>& error_id = std::nullopt) const;

 private:
  McpErrorCode code_;
  nlohmann::json details_;
};

// Convenience for the most common handler failure.
[[nodiscard]] McpToolError invalid_params(const std::string& message, const std::string& param = "");

}  // namespace lancet::response
