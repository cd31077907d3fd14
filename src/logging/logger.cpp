#include "lancet/logging/logger.h"

namespace lancet::logging {

void Logger::log(const LogLevel level, std::string message, nlohmann::json fields) const {
  LogEvent event;
  event.level = level;
  event.logger = name_;
  event.message = std::move(message);
  event.fields = std::move(fields);
  event.timestamp = clock_->now_iso8601();
  sink_->write(event);
}

}  // namespace lancet::logging
