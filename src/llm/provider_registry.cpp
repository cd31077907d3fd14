#include "lancet/llm/provider_registry.h"

#include <exception>
#include <stdexcept>

namespace lancet::llm {

core::Result<bool, std::string> LlmProviderRegistry::register_provider(
    std::shared_ptr<ILlmProvider> provider, const bool set_default) {
  if (!provider) {
    return core::Result<bool, std::string>::err("provider is null");
  }
  const std::string name = provider->name();
  bool is_default = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (providers_.count(name) > 0) {
      return core::Result<bool, std::string>::err("Provider '" + name + "' already registered");
    }
    providers_.emplace(name, std::move(provider));
    if (set_default || !default_name_.has_value()) {
      default_name_ = name;
      is_default = true;
    }
  }
  logger_.info("LLM provider registered", {{"provider", name}, {"is_default", is_default}});
  return core::Result<bool, std::string>::ok(true);
}

std::shared_ptr<ILlmProvider> LlmProviderRegistry::unregister_provider(const std::string& name) {
  std::shared_ptr<ILlmProvider> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = providers_.find(name);
    if (it == providers_.end()) {
      return nullptr;
    }
    removed = std::move(it->second);
    providers_.erase(it);
    if (default_name_ == name) {
      default_name_ = providers_.empty() ? std::nullopt
                                         : std::optional<std::string>(providers_.begin()->first);
    }
  }
  logger_.info("LLM provider unregistered", {{"provider", name}});
  return removed;
}

std::shared_ptr<ILlmProvider> LlmProviderRegistry::get(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = providers_.find(name);
  return it == providers_.end() ? nullptr : it->second;
}

std::shared_ptr<ILlmProvider> LlmProviderRegistry::get_default() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!default_name_.has_value()) {
    return nullptr;
  }
  const auto it = providers_.find(*default_name_);
  return it == providers_.end() ? nullptr : it->second;
}

core::Result<bool, std::string> LlmProviderRegistry::set_default(const std::string& name) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (providers_.count(name) == 0) {
      return core::Result<bool, std::string>::err("Provider '" + name + "' not registered");
    }
    default_name_ = name;
  }
  logger_.info("Default LLM provider changed", {{"provider", name}});
  return core::Result<bool, std::string>::ok(true);
}

std::vector<std::string> LlmProviderRegistry::list_providers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(providers_.size());
  for (const auto& [name, _] : providers_) {
    names.push_back(name);
  }
  return names;
}

std::optional<std::string> LlmProviderRegistry::default_name() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_name_;
}

std::vector<std::pair<std::string, std::shared_ptr<ILlmProvider>>>
LlmProviderRegistry::ordered_providers(const std::vector<std::string>& provider_order) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, std::shared_ptr<ILlmProvider>>> ordered;

  const auto add = [&](const std::string& name) {
    for (const auto& entry : ordered) {
      if (entry.first == name) {
        return;
      }
    }
    const auto it = providers_.find(name);
    if (it != providers_.end()) {
      ordered.emplace_back(name, it->second);
    }
  };

  if (!provider_order.empty()) {
    for (const auto& name : provider_order) {
      add(name);
    }
    return ordered;
  }
  if (default_name_.has_value()) {
    add(*default_name_);
  }
  for (const auto& [name, _] : providers_) {
    add(name);
  }
  return ordered;
}

std::map<std::string, LlmHealthStatus> LlmProviderRegistry::get_all_health() {
  std::map<std::string, LlmHealthStatus> health;
  for (const auto& [name, provider] : ordered_providers({})) {
    try {
      health[name] = provider->get_health();
    } catch (const std::exception& e) {
      logger_.error("Failed to get health", {{"provider", name}, {"error", e.what()}});
      LlmHealthStatus status;
      status.state = LlmHealthState::kUnhealthy;
      status.message = e.what();
      health[name] = status;
    }
  }
  return health;
}

template <typename Call>
LlmResponse LlmProviderRegistry::run_with_fallback(const char* operation,
                                                   const LlmOptions& options,
                                                   const std::vector<std::string>& provider_order,
                                                   Call&& call) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (providers_.empty()) {
      throw std::runtime_error("No LLM providers registered");
    }
  }

  std::string errors;
  const auto record = [&errors](const std::string& name, const std::string& error) {
    if (!errors.empty()) {
      errors += "; ";
    }
    errors += name + ": " + error;
  };

  for (const auto& [name, provider] : ordered_providers(provider_order)) {
    try {
      const LlmHealthStatus health = provider->get_health();
      if (health.state == LlmHealthState::kUnhealthy) {
        logger_.debug("Skipping unhealthy provider",
                      {{"provider", name}, {"operation", operation}, {"message", health.message}});
        continue;
      }

      LlmResponse response = call(*provider);
      if (response.ok()) {
        return response;
      }
      record(name, response.error_message);
      logger_.warning("LLM provider returned error",
                      {{"provider", name}, {"operation", operation}});
    } catch (const std::exception& e) {
      record(name, e.what());
      logger_.error("LLM provider failed", {{"provider", name}, {"operation", operation}});
    }
  }

  return LlmResponse::make_error(
      "All providers failed: " + (errors.empty() ? std::string("No providers available") : errors),
      options.model.value_or("unknown"), "none");
}

LlmResponse LlmProviderRegistry::generate_with_fallback(
    const std::string& prompt, const LlmOptions& options,
    const std::vector<std::string>& provider_order) {
  return run_with_fallback("generate", options, provider_order,
                           [&](ILlmProvider& provider) { return provider.generate(prompt, options); });
}

LlmResponse LlmProviderRegistry::chat_with_fallback(const std::vector<ChatMessage>& messages,
                                                    const LlmOptions& options,
                                                    const std::vector<std::string>& provider_order) {
  return run_with_fallback("chat", options, provider_order,
                           [&](ILlmProvider& provider) { return provider.chat(messages, options); });
}

void LlmProviderRegistry::close_all() {
  for (const auto& [name, provider] : ordered_providers({})) {
    try {
      provider->close();
    } catch (const std::exception& e) {
      logger_.error("Failed to close provider", {{"provider", name}, {"error", e.what()}});
    }
  }
  logger_.info("All LLM providers closed");
}

void LlmProviderRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  providers_.clear();
  default_name_.reset();
}

}  // namespace lancet::llm
