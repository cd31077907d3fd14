#pragma once

#include "lancet/core/result.h"
#include "lancet/logging/logger.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lancet::response {

using SchemaPtr = std::shared_ptr<const nlohmann::json>;

// is_valid_tool_name accepts 1-64 characters of [A-Za-z0-9_-]. Anything else could escape the
// schema directory.
[[nodiscard]] bool is_valid_tool_name(std::string_view tool_name);

// load_schema_file parses one schema document. kNotFound when the file does not exist,
// kMalformed when it is not a JSON object.
[[nodiscard]] core::Result<SchemaPtr, core::SchemaError> load_schema_file(
    const std::filesystem::path& path);

// SchemaRegistry caches <dir>/<tool>.json per tool and reloads a schema only when the file's
// modification time changes. Cached schemas are immutable; a reload swaps the entry under the
// registry mutex, so callers holding the old pointer keep a consistent document.
class SchemaRegistry {
 public:
  SchemaRegistry(std::filesystem::path schema_dir, logging::Logger logger)
      : schema_dir_(std::move(schema_dir)), logger_(std::move(logger)) {}

  // get_schema returns nullptr when the schema is missing or has never loaded cleanly.
  // A malformed file keeps serving the previously cached version.
  [[nodiscard]] SchemaPtr get_schema(const std::string& tool_name);

  // list_tools returns the tool names with a schema file in the directory, sorted.
  [[nodiscard]] std::vector<std::string> list_tools() const;

  [[nodiscard]] const std::filesystem::path& schema_dir() const { return schema_dir_; }

  // reset drops every cached entry.
  void reset();

 private:
  struct Entry {
    SchemaPtr schema;                             // NOLINT(readability-identifier-naming)
    std::filesystem::file_time_type mtime;        // NOLINT(readability-identifier-naming)
  };

  std::filesystem::path schema_dir_;
  logging::Logger logger_;
  std::mutex mutex_;
  std::map<std::string, Entry> cache_;
};

}  // namespace lancet::response
