#include "lancet/storage/sqlite/sqlite_domain_policy_store.h"

#include <sqlite3.h>

#include <utility>

namespace lancet::storage::sqlite {

SqliteDomainPolicyStore::SqliteDomainPolicyStore(std::shared_ptr<SqliteDb> db)
    : db_(std::move(db)) {}

std::optional<trust::TrustLevel> SqliteDomainPolicyStore::lookup_exact(
    const std::string& domain) const {
  PreparedStatement stmt(db_->connection(),
                         "SELECT trust_level FROM domain_policies WHERE domain = ?");
  if (!stmt.is_valid()) {
    return std::nullopt;
  }
  stmt.bind_text(1, domain);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return trust::parse_trust_level(stmt.column_text(0));
}

std::optional<trust::TrustLevel> SqliteDomainPolicyStore::get_domain_trust_level(
    const std::string& domain) const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  for (std::string d = trust::normalize_domain(domain); !d.empty(); d = trust::parent_domain(d)) {
    if (auto level = lookup_exact(d)) {
      return level;
    }
  }
  return std::nullopt;
}

core::Result<bool, std::string> SqliteDomainPolicyStore::set_domain_trust_level(
    const std::string& domain, const trust::TrustLevel level, const std::string& updated_at) {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO domain_policies (domain, trust_level, updated_at) VALUES (?, ?, ?)
    ON CONFLICT(domain) DO UPDATE SET trust_level = excluded.trust_level,
                                      updated_at = excluded.updated_at
  )");
  if (!stmt.is_valid()) {
    return core::Result<bool, std::string>::err("Failed to prepare policy upsert: " +
                                                stmt.error());
  }
  stmt.bind_text(1, trust::normalize_domain(domain));
  stmt.bind_text(2, trust::to_string(level));
  stmt.bind_text(3, updated_at);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return core::Result<bool, std::string>::err("Failed to store domain policy: " +
                                                std::string(sqlite3_errmsg(db_->connection())));
  }
  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDomainPolicyStore::record_override(
    const trust::DomainOverrideRule& rule) {
  std::lock_guard<std::mutex> lock(db_->mutex());

  auto begin = db_->exec("BEGIN IMMEDIATE");
  if (!begin.has_value()) {
    return begin;
  }

  const auto fail = [this](const std::string& what) {
    std::string error = what + ": " + sqlite3_errmsg(db_->connection());
    const auto rollback = db_->exec("ROLLBACK");
    if (!rollback.has_value()) {
      error += " (" + rollback.error() + ")";
    }
    return core::Result<bool, std::string>::err(error);
  };

  {
    PreparedStatement stmt(db_->connection(), R"(
      UPDATE domain_override_rules SET is_active = 0, updated_at = ?
       WHERE domain_pattern = ? AND is_active = 1
    )");
    if (!stmt.is_valid()) {
      return fail("Failed to prepare override deactivation");
    }
    stmt.bind_text(1, rule.updated_at);
    stmt.bind_text(2, rule.domain_pattern);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail("Failed to deactivate previous overrides");
    }
  }

  {
    PreparedStatement stmt(db_->connection(), R"(
      INSERT INTO domain_override_rules
        (rule_id, domain_pattern, decision, reason, created_at, updated_at, is_active, created_by)
      VALUES (?, ?, ?, ?, ?, ?, ?, ?)
    )");
    if (!stmt.is_valid()) {
      return fail("Failed to prepare override insert");
    }
    stmt.bind_text(1, rule.rule_id);
    stmt.bind_text(2, rule.domain_pattern);
    stmt.bind_text(3, trust::to_string(rule.decision));
    stmt.bind_text(4, rule.reason);
    stmt.bind_text(5, rule.created_at);
    stmt.bind_text(6, rule.updated_at);
    stmt.bind_int(7, rule.is_active ? 1 : 0);
    stmt.bind_text(8, rule.created_by);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
      return fail("Failed to insert override rule");
    }
  }

  return db_->exec("COMMIT");
}

std::vector<trust::DomainOverrideRule> SqliteDomainPolicyStore::list_active_overrides() const {
  std::lock_guard<std::mutex> lock(db_->mutex());
  PreparedStatement stmt(db_->connection(), R"(
    SELECT rule_id, domain_pattern, decision, reason, created_at, updated_at, created_by
      FROM domain_override_rules
     WHERE is_active = 1
     ORDER BY updated_at ASC, rowid ASC
  )");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<trust::DomainOverrideRule> rules;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    const auto decision = trust::parse_override_decision(stmt.column_text(2));
    if (!decision.has_value()) {
      continue;
    }
    trust::DomainOverrideRule rule;
    rule.rule_id = stmt.column_text(0);
    rule.domain_pattern = stmt.column_text(1);
    rule.decision = *decision;
    rule.reason = stmt.column_text(3);
    rule.created_at = stmt.column_text(4);
    rule.updated_at = stmt.column_text(5);
    rule.created_by = stmt.column_text(6);
    rules.push_back(std::move(rule));
  }
  return rules;
}

}  // namespace lancet::storage::sqlite
