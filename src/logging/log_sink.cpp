#include "lancet/logging/log_sink.h"

#include <iostream>

namespace lancet::logging {

void StderrLogSink::write(const LogEvent& event) {
  if (event.level < min_level_) {
    return;
  }
  const std::string line = to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << line << "\n";
}

void InMemoryLogSink::write(const LogEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<LogEvent> InMemoryLogSink::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::size_t InMemoryLogSink::count(const LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (const auto& event : events_) {
    if (event.level == level) {
      ++n;
    }
  }
  return n;
}

bool InMemoryLogSink::contains_message(const std::string_view message) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& event : events_) {
    if (event.message == message) {
      return true;
    }
  }
  return false;
}

void InMemoryLogSink::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.clear();
}

}  // namespace lancet::logging
