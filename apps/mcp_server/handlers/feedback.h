#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

#include <string>

namespace lancet::mcp::handlers {

// feedback applies an operator correction:
//   domain_block   {domain_pattern, reason}
//   domain_unblock {domain_pattern, reason}
//   claim_reject   {claim_id, domain, reason}
// Domain decisions are persisted as override rules and replayed at the next startup.
nlohmann::json handle_feedback(const nlohmann::json& params, ServerContext& ctx);

// validate_domain_pattern throws INVALID_PARAMS for empty and TLD-wide patterns.
void validate_domain_pattern(const std::string& pattern);

}  // namespace lancet::mcp::handlers
