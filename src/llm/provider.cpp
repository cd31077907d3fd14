#include "lancet/llm/provider.h"

namespace lancet::llm {

const char* to_string(const LlmHealthState state) {
  switch (state) {
    case LlmHealthState::kHealthy:
      return "healthy";
    case LlmHealthState::kDegraded:
      return "degraded";
    case LlmHealthState::kUnhealthy:
      return "unhealthy";
    case LlmHealthState::kUnknown:
      return "unknown";
  }
  return "unknown";
}

LlmResponse LlmResponse::success(std::string text, std::string model, std::string provider) {
  LlmResponse response;
  response.text = std::move(text);
  response.status = LlmResponseStatus::kSuccess;
  response.model = std::move(model);
  response.provider = std::move(provider);
  return response;
}

LlmResponse LlmResponse::make_error(std::string error, std::string model, std::string provider,
                                    const LlmResponseStatus status) {
  LlmResponse response;
  response.status = status;
  response.model = std::move(model);
  response.provider = std::move(provider);
  response.error_message = std::move(error);
  return response;
}

}  // namespace lancet::llm
