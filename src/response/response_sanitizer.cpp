#include "lancet/response/response_sanitizer.h"

#include "lancet/core/ascii.h"
#include "lancet/logging/redaction.h"
#include "lancet/response/errors.h"
#include "lancet/response/response_meta.h"
#include "lancet/security/output_validator.h"

#include <algorithm>
#include <vector>

namespace lancet::response {

using nlohmann::json;

SanitizationStats& SanitizationStats::operator+=(const SanitizationStats& other) {
  fields_removed += other.fields_removed;
  fields_sanitized += other.fields_sanitized;
  llm_fields_processed += other.llm_fields_processed;
  leakage_detected += other.leakage_detected;
  errors_sanitized += other.errors_sanitized;
  return *this;
}

json to_json(const SanitizationStats& stats) {
  return json{{"fields_removed", stats.fields_removed},
              {"fields_sanitized", stats.fields_sanitized},
              {"llm_fields_processed", stats.llm_fields_processed},
              {"leakage_detected", stats.leakage_detected},
              {"errors_sanitized", stats.errors_sanitized}};
}

namespace {

struct Walk {
  SanitizationStats& stats;                           // NOLINT(readability-identifier-naming)
  std::optional<std::string_view> system_prompt;      // NOLINT(readability-identifier-naming)
  const security::OutputValidatorOptions& validator;  // NOLINT(readability-identifier-naming)
  std::vector<std::string> removed_fields;            // NOLINT(readability-identifier-naming)
  std::vector<std::string> leaked_markers;            // NOLINT(readability-identifier-naming)
};

bool const_matches(const json& obj, const json& variant) {
  const auto props = variant.find("properties");
  if (props == variant.end() || !props->is_object()) {
    return true;
  }
  for (const auto& [key, prop] : props->items()) {
    if (!prop.is_object() || !prop.contains("const")) {
      continue;
    }
    const auto it = obj.find(key);
    if (it == obj.end() || *it != prop["const"]) {
      return false;
    }
  }
  return true;
}

const json* match_one_of(const json& obj, const json& variants) {
  for (const auto& variant : variants) {
    if (!variant.is_object()) {
      continue;
    }
    bool has_required = true;
    if (const auto req = variant.find("required"); req != variant.end() && req->is_array()) {
      has_required = std::all_of(req->begin(), req->end(), [&obj](const json& key) {
        return key.is_string() && obj.contains(key.get<std::string>());
      });
    }
    if (has_required && const_matches(obj, variant)) {
      return &variant;
    }
  }
  return nullptr;
}

void note_leaked_markers(Walk& walk, const std::string& original) {
  if (!walk.system_prompt.has_value()) {
    return;
  }
  const std::string haystack = core::normalize_ascii_lower(original);
  for (const auto& marker :
       security::leakage_markers(*walk.system_prompt, walk.validator.tag_prefix)) {
    if (haystack.find(core::normalize_ascii_lower(marker)) != std::string::npos &&
        std::find(walk.leaked_markers.begin(), walk.leaked_markers.end(), marker) ==
            walk.leaked_markers.end()) {
      walk.leaked_markers.push_back(marker);
    }
  }
}

json sanitize_llm_value(const json& value, Walk& walk) {
  if (!value.is_string()) {
    return value;
  }
  const auto& text = value.get_ref<const std::string&>();
  ++walk.stats.llm_fields_processed;
  auto result = security::validate_llm_output(text, std::nullopt, walk.system_prompt,
                                              walk.validator);
  if (result.had_suspicious_content || result.leakage_detected) {
    ++walk.stats.fields_sanitized;
  }
  if (result.leakage_detected) {
    ++walk.stats.leakage_detected;
    note_leaked_markers(walk, text);
  }
  return json(std::move(result.validated_text));
}

json filter_value(const json& value, const json& schema, Walk& walk);

json filter_object(const json& obj, const json& schema, Walk& walk) {
  if (const auto one_of = schema.find("oneOf");
      one_of != schema.end() && one_of->is_array() && !one_of->empty()) {
    const json* variant = match_one_of(obj, *one_of);
    return filter_object(obj, variant != nullptr ? *variant : one_of->front(), walk);
  }

  const auto props = schema.find("properties");
  if (props == schema.end() || !props->is_object() || props->empty()) {
    return obj;
  }

  json out = json::object();
  for (const auto& [key, child] : obj.items()) {
    if (key == kMetaKey) {
      out[key] = child;
      continue;
    }
    const auto prop = props->find(key);
    if (prop == props->end()) {
      ++walk.stats.fields_removed;
      walk.removed_fields.push_back(key);
      continue;
    }
    out[key] = filter_value(child, *prop, walk);
  }
  return out;
}

json filter_value(const json& value, const json& schema, Walk& walk) {
  if (!schema.is_object()) {
    return value;
  }
  if (const auto flag = schema.find(kLlmGeneratedKeyword);
      flag != schema.end() && flag->is_boolean() && flag->get<bool>()) {
    return sanitize_llm_value(value, walk);
  }
  if (value.is_object()) {
    return filter_object(value, schema, walk);
  }
  if (value.is_array()) {
    const auto items = schema.find("items");
    if (items == schema.end()) {
      return value;
    }
    json out = json::array();
    for (const auto& item : value) {
      out.push_back(filter_value(item, *items, walk));
    }
    return out;
  }
  return value;
}

}  // namespace

ResponseSanitization ResponseSanitizer::sanitize_response(
    const json& response, const std::string& tool_name,
    std::optional<std::string_view> system_prompt, const std::string& task_id) {
  ResponseSanitization out;
  const SchemaPtr schema = schemas_->get_schema(tool_name);
  if (!schema) {
    logger_.warning("response_unsanitized", {{"tool", tool_name}, {"reason", "no_schema"}});
    out.response = response;
    return out;
  }
  out.schema_found = true;

  const security::OutputValidatorOptions validator{options_.tag_prefix};
  Walk walk{out.stats, system_prompt, validator, {}, {}};
  out.response = filter_value(response, *schema, walk);

  if (out.stats.leakage_detected > 0 && out.response.is_object()) {
    auto& meta = out.response[kMetaKey];
    if (!meta.is_object()) {
      meta = create_minimal_meta(clock_->now_iso8601());
    }
    auto& warnings = meta["security_warnings"];
    if (!warnings.is_array()) {
      warnings = json::array();
    }
    warnings.push_back(to_json(SecurityWarning{
        "prompt_leakage", "Model output contained prompt markers and was masked", "warning"}));
  }

  if (out.stats.had_modifications()) {
    logger_.info("response_sanitized", {{"tool", tool_name},
                                        {"fields_removed", out.stats.fields_removed},
                                        {"llm_fields_processed", out.stats.llm_fields_processed},
                                        {"leakage_detected", out.stats.leakage_detected}});
  }

  if (audit_ != nullptr) {
    const std::string source = "response:" + tool_name;
    if (!walk.removed_fields.empty()) {
      audit_->log_security_event(
          storage::SecurityEventType::kUnknownFieldRemoved, storage::Severity::kLow,
          {{"tool", tool_name}, {"fields", walk.removed_fields}}, task_id);
    }
    if (out.stats.fields_sanitized > 0) {
      audit_->log_security_event(
          storage::SecurityEventType::kLlmFieldSanitized, storage::Severity::kMedium,
          {{"tool", tool_name}, {"fields_sanitized", out.stats.fields_sanitized}}, task_id);
    }
    if (out.stats.leakage_detected > 0) {
      audit_->log_prompt_leakage(walk.leaked_markers, source, task_id);
    }
  }

  record(out.stats);
  return out;
}

json ResponseSanitizer::sanitize_error(const std::exception& e,
                                       std::optional<std::string> error_id) {
  const std::string id = error_id.has_value() ? *error_id : id_gen_->next("err");

  auto redacted =
      logging::sanitize_exception_message(e.what(), options_.tag_prefix, options_.max_error_length);
  std::string message = redacted.redactions > kMaxErrorRedactions ? std::string(kGenericErrorMessage)
                                                                  : std::move(redacted.text);
  if (message.empty()) {
    message = kGenericErrorMessage;
  }

  json payload;
  if (const auto* tool_error = dynamic_cast<const McpToolError*>(&e); tool_error != nullptr) {
    payload = json{{"ok", false},
                   {"error_code", to_string(tool_error->code())},
                   {"error", message},
                   {"error_id", id}};
    if (tool_error->details().is_object() && !tool_error->details().empty()) {
      payload["details"] = logging::sanitize_details(tool_error->details(), options_.tag_prefix);
    }
  } else {
    payload = json{{"ok", false},
                   {"error_code", to_string(McpErrorCode::kInternalError)},
                   {"error", message},
                   {"error_id", id}};
  }

  logger_.error("tool_error", {{"error_id", id},
                               {"error_type", logging::describe_exception_type(e)},
                               {"redactions", redacted.redactions}});

  SanitizationStats stats;
  stats.errors_sanitized = 1;
  if (const SchemaPtr schema = schemas_->get_schema("error"); schema) {
    const security::OutputValidatorOptions validator{options_.tag_prefix};
    Walk walk{stats, std::nullopt, validator, {}, {}};
    payload = filter_value(payload, *schema, walk);
  }

  if (audit_ != nullptr && redacted.redactions > 0) {
    audit_->log_security_event(
        storage::SecurityEventType::kErrorSanitized, storage::Severity::kLow,
        {{"error_id", id}, {"redactions", redacted.redactions}});
  }

  record(stats);
  return payload;
}

SanitizationStats ResponseSanitizer::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return totals_;
}

void ResponseSanitizer::reset_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  totals_ = SanitizationStats{};
}

void ResponseSanitizer::record(const SanitizationStats& stats) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  totals_ += stats;
}

}  // namespace lancet::response
