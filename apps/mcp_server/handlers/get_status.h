#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace lancet::mcp::handlers {

// get_status reports the trust overview: blocked domains with their restore path, per-domain
// claim buckets, queued notifications and the security counters.
nlohmann::json handle_get_status(const nlohmann::json& params, ServerContext& ctx);

}  // namespace lancet::mcp::handlers
