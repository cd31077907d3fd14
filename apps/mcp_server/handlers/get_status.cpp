#include "get_status.h"

#include "lancet/core/version.h"
#include "lancet/response/errors.h"
#include "lancet/response/response_meta.h"

#include <string>

namespace lancet::mcp::handlers {

using json = nlohmann::json;

json handle_get_status(const json& params, ServerContext& ctx) {
  auto& verifier = ctx.services.verifier;

  json result;
  result["ok"] = true;
  result["server"] = {{"name", core::kServerName}, {"version", core::kBuildVersion}};

  json overview;
  overview["blocked_domains"] = json::array();
  const auto blocked = verifier.get_blocked_domains_info();
  for (const auto& info : blocked) {
    overview["blocked_domains"].push_back(trust::to_json(info));
  }

  overview["domains"] = json::array();
  if (const auto it = params.find("domain"); it != params.end()) {
    if (!it->is_string() || it->get<std::string>().empty()) {
      throw response::invalid_params("domain must be a non-empty string", "domain");
    }
    const auto state = verifier.get_domain_state(it->get<std::string>());
    if (state.has_value()) {
      overview["domains"].push_back(trust::to_json(*state));
    }
  } else {
    for (const auto& state : verifier.get_all_domain_states()) {
      overview["domains"].push_back(trust::to_json(state));
    }
  }
  overview["pending_notifications"] = verifier.get_pending_notification_count();
  result["trust"] = std::move(overview);

  result["security"] = {
      {"journal_events", ctx.services.security_events.count()},
      {"sanitizer", response::to_json(ctx.services.sanitizer.stats())},
  };

  auto meta = verifier.build_response_meta({});
  for (const auto& info : blocked) {
    meta.add_blocked_domain(info.domain);
  }
  return response::attach_meta(std::move(result), meta.build());
}

}  // namespace lancet::mcp::handlers
