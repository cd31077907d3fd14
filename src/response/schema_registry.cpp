#include "lancet/response/schema_registry.h"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace lancet::response {

namespace fs = std::filesystem;

bool is_valid_tool_name(std::string_view tool_name) {
  if (tool_name.empty() || tool_name.size() > 64) {
    return false;
  }
  return std::all_of(tool_name.begin(), tool_name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
  });
}

core::Result<SchemaPtr, core::SchemaError> load_schema_file(const fs::path& path) {
  std::ifstream in(path);
  if (!in) {
    return core::Result<SchemaPtr, core::SchemaError>::err(core::SchemaError::kNotFound);
  }
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    return core::Result<SchemaPtr, core::SchemaError>::err(core::SchemaError::kMalformed);
  }
  return core::Result<SchemaPtr, core::SchemaError>::ok(
      std::make_shared<const nlohmann::json>(std::move(doc)));
}

SchemaPtr SchemaRegistry::get_schema(const std::string& tool_name) {
  if (!is_valid_tool_name(tool_name)) {
    logger_.warning("schema_invalid_tool_name", {{"tool_length", tool_name.size()}});
    return nullptr;
  }

  const fs::path path = schema_dir_ / (tool_name + ".json");
  std::error_code ec;
  const auto mtime = fs::last_write_time(path, ec);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(tool_name);
  if (ec) {
    if (it != cache_.end()) {
      cache_.erase(it);
    }
    logger_.warning("schema_missing", {{"tool", tool_name}});
    return nullptr;
  }
  if (it != cache_.end() && it->second.mtime == mtime) {
    return it->second.schema;
  }

  auto loaded = load_schema_file(path);
  if (!loaded.has_value()) {
    if (loaded.error() == core::SchemaError::kMalformed) {
      logger_.warning("schema_malformed",
                      {{"tool", tool_name}, {"keeping_previous", it != cache_.end()}});
    } else {
      logger_.warning("schema_missing", {{"tool", tool_name}});
    }
    return it != cache_.end() ? it->second.schema : nullptr;
  }

  const bool reloaded = it != cache_.end();
  cache_[tool_name] = Entry{loaded.value(), mtime};
  logger_.debug(reloaded ? "schema_reloaded" : "schema_loaded", {{"tool", tool_name}});
  return loaded.value();
}

std::vector<std::string> SchemaRegistry::list_tools() const {
  std::vector<std::string> tools;
  std::error_code ec;
  fs::directory_iterator it(schema_dir_, ec);
  if (ec) {
    return tools;
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != ".json") {
      continue;
    }
    auto stem = entry.path().stem().string();
    if (is_valid_tool_name(stem)) {
      tools.push_back(std::move(stem));
    }
  }
  std::sort(tools.begin(), tools.end());
  return tools;
}

void SchemaRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

}  // namespace lancet::response
