#pragma once

#include "lancet/core/result.h"
#include "lancet/llm/provider.h"
#include "lancet/logging/logger.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lancet::llm {

// LlmProviderRegistry maps provider names to shared handles with one designated default.
// Constructed explicitly at the composition root; reset() returns it to the empty state.
// Thread-safe. Provider calls run outside the registry lock.
class LlmProviderRegistry {
 public:
  explicit LlmProviderRegistry(logging::Logger logger) : logger_(std::move(logger)) {}

  LlmProviderRegistry(const LlmProviderRegistry&) = delete;
  LlmProviderRegistry& operator=(const LlmProviderRegistry&) = delete;
  LlmProviderRegistry(LlmProviderRegistry&&) = delete;
  LlmProviderRegistry& operator=(LlmProviderRegistry&&) = delete;
  ~LlmProviderRegistry() = default;

  // Registers under provider->name(). The first provider becomes the default.
  // Returns an error for a duplicate name or a null provider.
  [[nodiscard]] core::Result<bool, std::string> register_provider(
      std::shared_ptr<ILlmProvider> provider, bool set_default = false);

  // Removes and returns the provider. If it was the default, the next remaining provider (in
  // name order) becomes the default.
  std::shared_ptr<ILlmProvider> unregister_provider(const std::string& name);

  [[nodiscard]] std::shared_ptr<ILlmProvider> get(const std::string& name) const;
  [[nodiscard]] std::shared_ptr<ILlmProvider> get_default() const;
  [[nodiscard]] core::Result<bool, std::string> set_default(const std::string& name);
  [[nodiscard]] std::vector<std::string> list_providers() const;
  [[nodiscard]] std::optional<std::string> default_name() const;

  // Health of every provider. A provider that throws reports kUnhealthy with its message.
  std::map<std::string, LlmHealthStatus> get_all_health();

  // Tries the default first, then the rest; skips unhealthy providers and returns the first
  // successful response, or an error response listing every failure.
  // Throws std::runtime_error when no provider is registered.
  LlmResponse generate_with_fallback(const std::string& prompt, const LlmOptions& options = {},
                                     const std::vector<std::string>& provider_order = {});
  LlmResponse chat_with_fallback(const std::vector<ChatMessage>& messages,
                                 const LlmOptions& options = {},
                                 const std::vector<std::string>& provider_order = {});

  void close_all();
  void reset();

 private:
  template <typename Call>
  LlmResponse run_with_fallback(const char* operation, const LlmOptions& options,
                                const std::vector<std::string>& provider_order, Call&& call);

  std::vector<std::pair<std::string, std::shared_ptr<ILlmProvider>>> ordered_providers(
      const std::vector<std::string>& provider_order) const;

  logging::Logger logger_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<ILlmProvider>> providers_;
  std::optional<std::string> default_name_;
};

}  // namespace lancet::llm
