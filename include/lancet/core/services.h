#pragma once

#include "lancet/llm/provider_registry.h"
#include "lancet/logging/audit_logger.h"
#include "lancet/response/response_sanitizer.h"
#include "lancet/response/schema_registry.h"
#include "lancet/storage/security_event_log.h"
#include "lancet/trust/domain_override.h"
#include "lancet/trust/source_verifier.h"

namespace lancet::core {

// Services is the composition root handed to every entry point.
// It holds references (not ownership); main() owns the concrete instances and keeps them alive
// for as long as any consumer runs.
struct Services {
  storage::ISecurityEventLog& security_events;   // NOLINT(readability-identifier-naming)
  logging::AuditLogger& audit;                   // NOLINT(readability-identifier-naming)
  trust::SourceVerifier& verifier;               // NOLINT(readability-identifier-naming)
  trust::IDomainOverrideStore& overrides;        // NOLINT(readability-identifier-naming)
  response::SchemaRegistry& schemas;             // NOLINT(readability-identifier-naming)
  response::ResponseSanitizer& sanitizer;        // NOLINT(readability-identifier-naming)
  llm::LlmProviderRegistry& providers;           // NOLINT(readability-identifier-naming)

  Services(storage::ISecurityEventLog& security_events, logging::AuditLogger& audit,
           trust::SourceVerifier& verifier, trust::IDomainOverrideStore& overrides,
           response::SchemaRegistry& schemas, response::ResponseSanitizer& sanitizer,
           llm::LlmProviderRegistry& providers)
      : security_events(security_events),
        audit(audit),
        verifier(verifier),
        overrides(overrides),
        schemas(schemas),
        sanitizer(sanitizer),
        providers(providers) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace lancet::core
