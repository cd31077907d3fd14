#pragma once

#include "lancet/logging/log_event.h"

#include <cstddef>
#include <mutex>
#include <string_view>
#include <vector>

namespace lancet::logging {

// ILogSink receives structured events. Implementations must be safe to call concurrently.
class ILogSink {
 public:
  virtual ~ILogSink() = default;
  virtual void write(const LogEvent& event) = 0;

 protected:
  ILogSink() = default;
  ILogSink(const ILogSink&) = default;
  ILogSink& operator=(const ILogSink&) = default;
  ILogSink(ILogSink&&) = default;
  ILogSink& operator=(ILogSink&&) = default;
};

// StderrLogSink writes one JSON object per line to std::cerr.
// stdout is reserved for the JSON-RPC channel.
class StderrLogSink final : public ILogSink {
 public:
  explicit StderrLogSink(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  void write(const LogEvent& event) override;

 private:
  LogLevel min_level_;
  std::mutex mutex_;
};

// InMemoryLogSink keeps every event for inspection in tests.
class InMemoryLogSink final : public ILogSink {
 public:
  void write(const LogEvent& event) override;

  [[nodiscard]] std::vector<LogEvent> events() const;
  [[nodiscard]] std::size_t count(LogLevel level) const;
  [[nodiscard]] bool contains_message(std::string_view message) const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<LogEvent> events_;
};

}  // namespace lancet::logging
