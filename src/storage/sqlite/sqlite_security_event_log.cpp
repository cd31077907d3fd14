#include "lancet/storage/sqlite/sqlite_security_event_log.h"

#include "lancet/storage/event_chain.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace lancet::storage::sqlite {

SqliteSecurityEventLog::SqliteSecurityEventLog(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

SqliteSecurityEventLog::AppendState SqliteSecurityEventLog::load_append_state(
    const std::string& task_id) {
  const auto it = chains_.find(task_id);
  if (it != chains_.end()) {
    return it->second;
  }

  AppendState state{0, std::string(kGenesisHash)};
  PreparedStatement stmt(db_->connection(),
                         "SELECT idx, event_hash FROM security_events WHERE task_id = ?"
                         " ORDER BY idx DESC LIMIT 1");
  if (stmt.is_valid()) {
    stmt.bind_text(1, task_id);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
      state.idx = sqlite3_column_int(stmt.get(), 0) + 1;
      state.previous_hash = stmt.column_text(1);
    }
  }
  return state;
}

core::Result<SecurityEvent, std::string> SqliteSecurityEventLog::append(
    const SecurityEvent& event) {
  using AppendResult = core::Result<SecurityEvent, std::string>;
  std::lock_guard<std::mutex> lock(mutex_);
  std::lock_guard<std::mutex> db_lock(db_->mutex());

  const AppendState state = load_append_state(event.task_id);

  SecurityEvent stored = event;
  stored.previous_hash = state.previous_hash;
  stored.event_hash = compute_event_hash(event, state.previous_hash);

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO security_events
      (event_id, task_id, idx, event_type, severity, details_json, created_at,
       previous_hash, event_hash)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    return AppendResult::err("Failed to prepare security event insert: " + stmt.error());
  }

  stmt.bind_text(1, stored.event_id);
  stmt.bind_text(2, stored.task_id);
  stmt.bind_int(3, state.idx);
  stmt.bind_text(4, to_string(stored.event_type));
  stmt.bind_text(5, to_string(stored.severity));
  stmt.bind_text(6, stored.details.dump());
  stmt.bind_text(7, stored.created_at);
  stmt.bind_text(8, stored.previous_hash);
  stmt.bind_text(9, stored.event_hash);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    // Another writer may have advanced the chain; reload from the table next time.
    chains_.erase(event.task_id);
    return AppendResult::err("Failed to insert security event: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }

  chains_[event.task_id] = AppendState{state.idx + 1, stored.event_hash};
  return AppendResult::ok(std::move(stored));
}

std::vector<SecurityEvent> SqliteSecurityEventLog::query(const std::string& task_id) const {
  std::lock_guard<std::mutex> db_lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT event_id, task_id, event_type, severity, details_json,"
                         "       created_at, previous_hash, event_hash"
                         "  FROM security_events WHERE task_id = ? ORDER BY idx");
  if (!stmt.is_valid()) {
    return {};
  }
  stmt.bind_text(1, task_id);

  std::vector<SecurityEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    SecurityEvent event;
    event.event_id = stmt.column_text(0);
    event.task_id = stmt.column_text(1);
    // Unknown names leave the defaults in place; verify_event_chain then reports the row.
    if (const auto type = parse_security_event_type(stmt.column_text(2))) {
      event.event_type = *type;
    }
    if (const auto severity = parse_severity(stmt.column_text(3))) {
      event.severity = *severity;
    }
    event.details = nlohmann::json::parse(stmt.column_text(4), nullptr, false);
    event.created_at = stmt.column_text(5);
    event.previous_hash = stmt.column_text(6);
    event.event_hash = stmt.column_text(7);
    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteSecurityEventLog::list_task_ids() const {
  std::lock_guard<std::mutex> db_lock(db_->mutex());
  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT task_id FROM security_events ORDER BY task_id");
  if (!stmt.is_valid()) {
    return {};
  }
  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(stmt.column_text(0));
  }
  return ids;
}

std::size_t SqliteSecurityEventLog::count() const {
  std::lock_guard<std::mutex> db_lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), "SELECT COUNT(*) FROM security_events");
  if (!stmt.is_valid() || sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

}  // namespace lancet::storage::sqlite
