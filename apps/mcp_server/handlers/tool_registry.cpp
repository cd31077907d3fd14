#include "tool_registry.h"

#include "feedback.h"
#include "get_status.h"
#include "sanitize_preview.h"

namespace lancet::mcp::handlers {

using json = nlohmann::json;

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"get_status", handle_get_status},
      {"feedback", handle_feedback},
      {"sanitize_preview", handle_sanitize_preview},
  };
}

json tool_definitions() {
  json tools = json::array();

  tools.push_back({
      {"name", "get_status"},
      {"description", "Trust overview: blocked domains, per-domain claim state, security counters"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", {{"domain", {{"type", "string"}}}}},
       }},
  });

  tools.push_back({
      {"name", "feedback"},
      {"description", "Operator correction: block or unblock a domain, or reject a claim"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"action",
                 {{"type", "string"},
                  {"enum", json::array({"domain_block", "domain_unblock", "claim_reject"})}}},
                {"domain_pattern",
                 {{"type", "string"},
                  {"description", "Domain or *.domain (domain_block, domain_unblock)"}}},
                {"claim_id", {{"type", "string"}}},
                {"domain", {{"type", "string"}, {"description", "Source domain (claim_reject)"}}},
                {"reason", {{"type", "string"}}},
            }},
           {"required", json::array({"action", "reason"})},
       }},
  });

  tools.push_back({
      {"name", "sanitize_preview"},
      {"description", "Run the input sanitizer on text and report what it changed"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties",
            {
                {"text", {{"type", "string"}}},
                {"max_length", {{"type", "integer"}, {"minimum", 1}}},
                {"output", {{"type", "string"}, {"description", "Model output to check"}}},
                {"task_id", {{"type", "string"}}},
            }},
           {"required", json::array({"text"})},
       }},
  });

  return tools;
}

}  // namespace lancet::mcp::handlers
