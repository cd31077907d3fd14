#pragma once

#include "lancet/storage/security_event_log.h"
#include "lancet/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace lancet::storage::sqlite {

// SqliteSecurityEventLog implements ISecurityEventLog with SQLite backend.
// Append-only; ordering within a chain comes from the idx column. The per-chain append state
// (next idx, last event_hash) is cached and the whole append runs under one lock so each chain
// stays linear.
class SqliteSecurityEventLog final : public ISecurityEventLog {
 public:
  explicit SqliteSecurityEventLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] core::Result<SecurityEvent, std::string> append(
      const SecurityEvent& event) override;
  [[nodiscard]] std::vector<SecurityEvent> query(const std::string& task_id) const override;
  [[nodiscard]] std::vector<std::string> list_task_ids() const override;
  [[nodiscard]] std::size_t count() const override;

 private:
  struct AppendState {
    int idx{0};
    std::string previous_hash{};
  };

  // Requires mutex_ held.
  AppendState load_append_state(const std::string& task_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, AppendState> chains_;
};

}  // namespace lancet::storage::sqlite
