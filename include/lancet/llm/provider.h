#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lancet::llm {

enum class LlmHealthState {
  kHealthy,
  kDegraded,
  kUnhealthy,
  kUnknown,
};

[[nodiscard]] const char* to_string(LlmHealthState state);

struct LlmHealthStatus {
  LlmHealthState state{LlmHealthState::kUnknown};  // NOLINT(readability-identifier-naming)
  std::vector<std::string> available_models;       // NOLINT(readability-identifier-naming)
  double success_rate{1.0};                        // NOLINT(readability-identifier-naming)
  double latency_ms{0.0};                          // NOLINT(readability-identifier-naming)
  std::string message;                             // NOLINT(readability-identifier-naming)
};

struct LlmOptions {
  std::optional<std::string> model;        // NOLINT(readability-identifier-naming)
  std::optional<double> temperature;       // NOLINT(readability-identifier-naming)
  std::optional<int> max_tokens;           // NOLINT(readability-identifier-naming)
  std::optional<std::string> system;       // NOLINT(readability-identifier-naming)
  std::vector<std::string> stop;           // NOLINT(readability-identifier-naming)
  std::optional<double> timeout_seconds;   // NOLINT(readability-identifier-naming)
};

struct ChatMessage {
  std::string role;     // NOLINT(readability-identifier-naming)
  std::string content;  // NOLINT(readability-identifier-naming)
};

enum class LlmResponseStatus {
  kSuccess,
  kError,
  kTimeout,
  kRateLimited,
};

struct LlmResponse {
  std::string text;                                     // NOLINT(readability-identifier-naming)
  LlmResponseStatus status{LlmResponseStatus::kError};  // NOLINT(readability-identifier-naming)
  std::string model;                                    // NOLINT(readability-identifier-naming)
  std::string provider;                                 // NOLINT(readability-identifier-naming)
  double elapsed_ms{0.0};                               // NOLINT(readability-identifier-naming)
  std::map<std::string, int> usage;                     // NOLINT(readability-identifier-naming)
  std::string error_message;                            // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return status == LlmResponseStatus::kSuccess; }

  static LlmResponse success(std::string text, std::string model, std::string provider);
  static LlmResponse make_error(std::string error, std::string model, std::string provider,
                                LlmResponseStatus status = LlmResponseStatus::kError);
};

// ILlmProvider is the seam to a model runtime. The runtime itself (network isolation,
// transport) lives outside this library.
class ILlmProvider {
 public:
  virtual ~ILlmProvider() = default;

  [[nodiscard]] virtual std::string name() const = 0;
  virtual LlmResponse generate(const std::string& prompt, const LlmOptions& options) = 0;
  virtual LlmResponse chat(const std::vector<ChatMessage>& messages,
                           const LlmOptions& options) = 0;
  virtual LlmHealthStatus get_health() = 0;
  virtual void close() = 0;

 protected:
  ILlmProvider() = default;
  ILlmProvider(const ILlmProvider&) = default;
  ILlmProvider& operator=(const ILlmProvider&) = default;
  ILlmProvider(ILlmProvider&&) = default;
  ILlmProvider& operator=(ILlmProvider&&) = default;
};

}  // namespace lancet::llm
