#pragma once

#include "lancet/core/clock.h"
#include "lancet/logging/log_sink.h"

#include <nlohmann/json.hpp>

#include <string>

namespace lancet::logging {

// Logger is a named, cheap-to-copy facade over an ILogSink.
// The sink and clock must outlive every Logger that refers to them.
class Logger {
 public:
  Logger(ILogSink& sink, core::IClock& clock, std::string name)
      : sink_(&sink), clock_(&clock), name_(std::move(name)) {}

  void log(LogLevel level, std::string message,
           nlohmann::json fields = nlohmann::json::object()) const;

  void debug(std::string message, nlohmann::json fields = nlohmann::json::object()) const {
    log(LogLevel::kDebug, std::move(message), std::move(fields));
  }
  void info(std::string message, nlohmann::json fields = nlohmann::json::object()) const {
    log(LogLevel::kInfo, std::move(message), std::move(fields));
  }
  void warning(std::string message, nlohmann::json fields = nlohmann::json::object()) const {
    log(LogLevel::kWarning, std::move(message), std::move(fields));
  }
  void error(std::string message, nlohmann::json fields = nlohmann::json::object()) const {
    log(LogLevel::kError, std::move(message), std::move(fields));
  }

  [[nodiscard]] const std::string& name() const { return name_; }

 private:
  ILogSink* sink_;
  core::IClock* clock_;
  std::string name_;
};

}  // namespace lancet::logging
