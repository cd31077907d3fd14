#include "lancet/core/clock.h"
#include "lancet/core/id_generator.h"
#include "lancet/core/services.h"
#include "lancet/core/version.h"
#include "lancet/llm/provider_registry.h"
#include "lancet/logging/audit_logger.h"
#include "lancet/logging/log_sink.h"
#include "lancet/logging/logger.h"
#include "lancet/logging/secure_logger.h"
#include "lancet/response/response_sanitizer.h"
#include "lancet/response/schema_registry.h"
#include "lancet/storage/event_chain.h"
#include "lancet/storage/security_event_log.h"
#include "lancet/storage/sqlite/sqlite_db.h"
#include "lancet/storage/sqlite/sqlite_domain_policy_store.h"
#include "lancet/storage/sqlite/sqlite_security_event_log.h"
#include "lancet/trust/domain_override.h"
#include "lancet/trust/domain_policy_store.h"
#include "lancet/trust/inmemory_trust_state_store.h"
#include "lancet/trust/notifier.h"
#include "lancet/trust/redis_config.h"
#include "lancet/trust/redis_trust_state_store.h"
#include "lancet/trust/source_verifier.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <iostream>
#include <memory>
#include <string>

using namespace lancet;

int main(int argc, char* argv[]) {
  auto config = mcp::parse_args(argc, argv);

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // ── Startup diagnostic block ──────────────────────────────────────────────
  // Every subsystem announces its operational mode. Ephemeral fallbacks are
  // printed as explicit WARNINGs.
  std::cerr << core::kServerName << " MCP Server v" << core::kBuildVersion << "\n";

  core::SystemClock clock;
  core::RandomIdGenerator id_gen;
  logging::StderrLogSink sink(config.log_level);

  // Security journal and domain policies share one SQLite database when --db is given.
  std::unique_ptr<storage::ISecurityEventLog> journal_owner;
  std::unique_ptr<trust::IDomainPolicyStore> policy_owner;
  std::unique_ptr<trust::IDomainOverrideStore> override_owner;
  trust::IDomainOverrideStore* overrides = nullptr;

  if (config.db_path.has_value()) {
    auto db_result = storage::sqlite::SqliteDb::open(config.db_path.value());
    if (!db_result.has_value()) {
      std::cerr << "Failed to open database: " << db_result.error() << "\n";
      return 1;
    }

    auto db = db_result.value();
    // ensure_schema_v2 chains v1; all schema migrations are idempotent.
    auto schema_result = db->ensure_schema_v2();
    if (!schema_result.has_value()) {
      std::cerr << "Failed to initialize schema: " << schema_result.error() << "\n";
      return 1;
    }

    journal_owner = std::make_unique<storage::sqlite::SqliteSecurityEventLog>(db);
    auto policy_store = std::make_unique<storage::sqlite::SqliteDomainPolicyStore>(db);
    overrides = policy_store.get();
    policy_owner = std::move(policy_store);
    std::cerr << "Storage:     SQLite -- " << config.db_path.value() << "\n";
  } else {
    journal_owner = std::make_unique<storage::InMemorySecurityEventLog>();
    policy_owner = std::make_unique<trust::InMemoryDomainPolicyStore>();
    override_owner = std::make_unique<trust::InMemoryDomainOverrideStore>();
    overrides = override_owner.get();
    std::cerr << "WARNING: No --db path specified. Running with EPHEMERAL in-memory storage.\n"
                 "         The security event journal and domain overrides will be LOST on\n"
                 "         process exit. Pass --db <path> to enable persistence.\n";
  }
  storage::ISecurityEventLog& journal = *journal_owner;

  // ── Audit chain verification ─────────────────────────────────────────────
  if (config.audit_chain_verify != mcp::AuditChainVerifyMode::kOff) {
    const auto failures = storage::verify_all_chains(journal);
    for (const auto& failure : failures) {
      std::cerr << (config.audit_chain_verify == mcp::AuditChainVerifyMode::kFail ? "ERROR"
                                                                                  : "WARNING")
                << ": security journal chain '"
                << (failure.task_id.empty() ? "<untasked>" : failure.task_id)
                << "' is corrupt at index " << failure.result.first_invalid_index << ": "
                << failure.result.error << "\n";
    }
    if (!failures.empty() && config.audit_chain_verify == mcp::AuditChainVerifyMode::kFail) {
      std::cerr << "Refusing to start: " << failures.size() << " corrupt journal chain(s).\n";
      return 1;
    }
    std::cerr << "Journal:     " << journal.list_task_ids().size() << " chain(s) verified, "
              << failures.size() << " corrupt\n";
  }

  // ── Trust state store ────────────────────────────────────────────────────
  std::unique_ptr<trust::ITrustStateStore> trust_store_owner;
  if (config.redis_uri.has_value()) {
    // Format was validated above.
    const auto redis_cfg = trust::parse_redis_uri(config.redis_uri.value()).value();
    try {
      trust_store_owner = std::make_unique<trust::RedisTrustStateStore>(redis_cfg);
    } catch (const std::exception& e) {
      std::cerr << "Failed to connect to Redis: " << e.what() << "\n";
      return 1;
    }
    std::cerr << "Trust state: Redis -- " << trust::redis_config_to_log_string(redis_cfg) << "\n";
  } else {
    trust_store_owner = std::make_unique<trust::InMemoryTrustStateStore>();
    std::cerr << "WARNING: No --redis URI specified. Trust state is process-local and EPHEMERAL.\n"
                 "         Blocked domains are restored only from persisted overrides.\n";
  }

  logging::Logger verifier_log(sink, clock, "lancet.trust");
  trust::SourceVerifier verifier(*trust_store_owner, *policy_owner, clock, verifier_log,
                                 trust::SourceVerifierOptions{
                                     config.security.min_independent_sources,
                                     config.security.max_rejection_rate});

  const auto replay = trust::apply_domain_overrides(overrides->list_active_overrides(), verifier);
  std::cerr << "Overrides:   " << replay.blocks << " block, " << replay.unblocks
            << " unblock rule(s) replayed\n";

  logging::AuditLogger audit(journal, logging::Logger(sink, clock, "lancet.audit"), id_gen, clock);

  response::SchemaRegistry schemas(config.schema_dir, logging::Logger(sink, clock, "lancet.schema"));
  response::ResponseSanitizer sanitizer(schemas, logging::Logger(sink, clock, "lancet.response"),
                                        id_gen, clock,
                                        response::ResponseSanitizerOptions{
                                            config.security.tag_prefix});
  sanitizer.set_audit_logger(&audit);
  std::cerr << "Schemas:     " << config.schema_dir << " (" << schemas.list_tools().size()
            << " tool schema(s))\n";

  llm::LlmProviderRegistry providers(logging::Logger(sink, clock, "lancet.llm"));

  logging::SecureLogger secure_log(logging::Logger(sink, clock, "lancet.mcp"), id_gen,
                                   logging::SecureLoggerOptions{config.security.tag_prefix,
                                                                config.security.max_preview_length});
  trust::LoggingNotifier notifier(logging::Logger(sink, clock, "lancet.notify"));

  core::Services services{journal, audit, verifier, *overrides, schemas, sanitizer, providers};
  mcp::ServerContext ctx{services, secure_log, notifier, id_gen, clock, config};

  std::cerr << "Listening on stdio for JSON-RPC requests...\n";
  // ─────────────────────────────────────────────────────────────────────────

  int exit_code = 0;
  try {
    mcp::run_server_loop(ctx, std::cin, std::cout);
  } catch (const std::exception& e) {
    const std::string error_id = id_gen.next("err");
    secure_log.log_exception(e, error_id);
    std::cerr << "Server stopped after an unrecoverable error (" << error_id << ")\n";
    exit_code = 1;
  }

  providers.close_all();
  return exit_code;
}
