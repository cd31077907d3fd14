#pragma once

#include "lancet/llm/provider.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lancet::testing {

// ScriptedProvider answers every call with a fixed response and records prompts.
class ScriptedProvider final : public llm::ILlmProvider {
 public:
  explicit ScriptedProvider(std::string name, std::string reply = "ok")
      : name_(std::move(name)), reply_(std::move(reply)) {}

  void set_health(const llm::LlmHealthState state) { health_ = state; }
  void fail_with_status(const std::string& error) { error_ = error; }
  void throw_on_call(const std::string& error) { throw_ = error; }

  [[nodiscard]] std::string name() const override { return name_; }

  llm::LlmResponse generate(const std::string& prompt, const llm::LlmOptions& options) override {
    prompts_.push_back(prompt);
    return respond(options);
  }

  llm::LlmResponse chat(const std::vector<llm::ChatMessage>& messages,
                        const llm::LlmOptions& options) override {
    prompts_.push_back(messages.empty() ? std::string{} : messages.back().content);
    return respond(options);
  }

  llm::LlmHealthStatus get_health() override {
    llm::LlmHealthStatus status;
    status.state = health_;
    status.available_models = {"scripted-1"};
    return status;
  }

  void close() override { closed_ = true; }

  [[nodiscard]] const std::vector<std::string>& prompts() const { return prompts_; }
  [[nodiscard]] bool closed() const { return closed_; }

 private:
  llm::LlmResponse respond(const llm::LlmOptions& options) {
    if (!throw_.empty()) {
      throw std::runtime_error(throw_);
    }
    const std::string model = options.model.value_or("scripted-1");
    if (!error_.empty()) {
      return llm::LlmResponse::make_error(error_, model, name_);
    }
    return llm::LlmResponse::success(reply_, model, name_);
  }

  std::string name_;
  std::string reply_;
  std::string error_;
  std::string throw_;
  llm::LlmHealthState health_{llm::LlmHealthState::kHealthy};
  std::vector<std::string> prompts_;
  bool closed_{false};
};

}  // namespace lancet::testing
