#pragma once

#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/core/services.h"
#include "lancet/logging/logger.h"
#include "lancet/logging/secure_logger.h"
#include "lancet/trust/notifier.h"

#include "config.h"

namespace lancet::mcp {

// ServerContext holds all process-lifetime service references passed to every tool handler.
// All references must remain valid for the lifetime of run_server_loop().
struct ServerContext {
  core::Services& services;           // NOLINT(readability-identifier-naming)
  logging::SecureLogger& secure_log;  // NOLINT(readability-identifier-naming)
  trust::INotifier& notifier;         // NOLINT(readability-identifier-naming)
  core::IIdGenerator& id_gen;         // NOLINT(readability-identifier-naming)
  core::IClock& clock;                // NOLINT(readability-identifier-naming)
  McpServerConfig& config;            // NOLINT(readability-identifier-naming)
};

}  // namespace lancet::mcp
