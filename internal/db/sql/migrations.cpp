#include "migrations.hpp"

#include "internal/observability/logging.hpp"

namespace jobguard::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered, uint64_t applied_at_ms) {
  executor.ExecuteSQL("CREATE TABLE IF NOT EXISTS jobguard_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms BIGINT NOT NULL);");

  for (const auto& migration : ordered) {
    for (const auto& statement : migration.statements) {
      executor.ExecuteSQL(statement);
    }
    executor.ExecuteSQL("INSERT INTO jobguard_schema_migrations(version, applied_at_ms) VALUES(" + std::to_string(migration.version) + ", " +
                        std::to_string(applied_at_ms) + ") ON CONFLICT(version) DO NOTHING;");
  }

  JOBGUARD_LOG_DEBUG("schema migrations applied", {observability::IntField("count", static_cast<int64_t>(ordered.size()))});
}

const std::vector<Migration>& SqliteMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS automation_jobs ("
           " id INTEGER PRIMARY KEY AUTOINCREMENT,"
           " idempotency_key TEXT NOT NULL UNIQUE,"
           " ticket_id INTEGER NOT NULL,"
           " operation_type TEXT NOT NULL,"
           " status INTEGER NOT NULL,"
           " claimed_by TEXT NOT NULL DEFAULT '',"
           " claimed_at_ms INTEGER NOT NULL DEFAULT 0,"
           " completed_at_ms INTEGER,"
           " result BLOB,"
           " error_message TEXT NOT NULL DEFAULT '',"
           " retry_count INTEGER NOT NULL DEFAULT 0,"
           " created_at_ms INTEGER NOT NULL,"
           " updated_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_jobs_claim_idx ON automation_jobs(status, claimed_by, claimed_at_ms);",
           "CREATE INDEX IF NOT EXISTS automation_jobs_updated_idx ON automation_jobs(updated_at_ms);",
       }},
      {2,
       {
           "CREATE TABLE IF NOT EXISTS automation_checkpoints ("
           " checkpoint_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " automation_type TEXT NOT NULL,"
           " current_step INTEGER NOT NULL,"
           " total_steps INTEGER NOT NULL,"
           " compression INTEGER NOT NULL,"
           " data_size_bytes INTEGER NOT NULL,"
           " raw_size_bytes INTEGER NOT NULL,"
           " checksum TEXT NOT NULL,"
           " created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_checkpoints_session_idx ON automation_checkpoints(session_id, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS automation_snapshots ("
           " snapshot_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " current_step INTEGER,"
           " total_steps INTEGER,"
           " compression INTEGER NOT NULL,"
           " data_size_bytes INTEGER NOT NULL,"
           " raw_size_bytes INTEGER NOT NULL,"
           " checksum TEXT NOT NULL,"
           " created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_snapshots_session_idx ON automation_snapshots(session_id, created_at_ms);",
       }},
      {3,
       {
           "CREATE TABLE IF NOT EXISTS automation_recoveries ("
           " recovery_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " target_id TEXT NOT NULL,"
           " strategy TEXT NOT NULL,"
           " status INTEGER NOT NULL,"
           " confidence REAL NOT NULL,"
           " integrity_score REAL NOT NULL,"
           " estimated_seconds INTEGER NOT NULL,"
           " success INTEGER NOT NULL,"
           " error TEXT NOT NULL DEFAULT '',"
           " recovery_time_ms INTEGER NOT NULL,"
           " created_at_ms INTEGER NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_recoveries_session_idx ON automation_recoveries(session_id, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS automation_steps ("
           " session_id TEXT NOT NULL,"
           " step_number INTEGER NOT NULL,"
           " route TEXT NOT NULL,"
           " action_type INTEGER NOT NULL,"
           " selector TEXT NOT NULL,"
           " result_status INTEGER NOT NULL,"
           " timing_ms INTEGER NOT NULL,"
           " retry_used INTEGER NOT NULL,"
           " reasoning TEXT NOT NULL DEFAULT '',"
           " evidence_ref TEXT NOT NULL DEFAULT '',"
           " created_at_ms INTEGER NOT NULL,"
           " PRIMARY KEY (session_id, step_number));",
       }},
  };
  return kMigrations;
}

const std::vector<Migration>& PostgresMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       {
           "CREATE TABLE IF NOT EXISTS automation_jobs ("
           " id BIGSERIAL PRIMARY KEY,"
           " idempotency_key TEXT NOT NULL UNIQUE,"
           " ticket_id BIGINT NOT NULL,"
           " operation_type TEXT NOT NULL,"
           " status SMALLINT NOT NULL,"
           " claimed_by TEXT NOT NULL DEFAULT '',"
           " claimed_at_ms BIGINT NOT NULL DEFAULT 0,"
           " completed_at_ms BIGINT,"
           " result BYTEA,"
           " error_message TEXT NOT NULL DEFAULT '',"
           " retry_count INTEGER NOT NULL DEFAULT 0,"
           " created_at_ms BIGINT NOT NULL,"
           " updated_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_jobs_claim_idx ON automation_jobs(status, claimed_by, claimed_at_ms);",
           "CREATE INDEX IF NOT EXISTS automation_jobs_updated_idx ON automation_jobs(updated_at_ms);",
       }},
      {2,
       {
           "CREATE TABLE IF NOT EXISTS automation_checkpoints ("
           " checkpoint_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " automation_type TEXT NOT NULL,"
           " current_step BIGINT NOT NULL,"
           " total_steps BIGINT NOT NULL,"
           " compression SMALLINT NOT NULL,"
           " data_size_bytes BIGINT NOT NULL,"
           " raw_size_bytes BIGINT NOT NULL,"
           " checksum TEXT NOT NULL,"
           " created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_checkpoints_session_idx ON automation_checkpoints(session_id, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS automation_snapshots ("
           " snapshot_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " current_step BIGINT,"
           " total_steps BIGINT,"
           " compression SMALLINT NOT NULL,"
           " data_size_bytes BIGINT NOT NULL,"
           " raw_size_bytes BIGINT NOT NULL,"
           " checksum TEXT NOT NULL,"
           " created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_snapshots_session_idx ON automation_snapshots(session_id, created_at_ms);",
       }},
      {3,
       {
           "CREATE TABLE IF NOT EXISTS automation_recoveries ("
           " recovery_id TEXT PRIMARY KEY,"
           " session_id TEXT NOT NULL,"
           " target_id TEXT NOT NULL,"
           " strategy TEXT NOT NULL,"
           " status SMALLINT NOT NULL,"
           " confidence DOUBLE PRECISION NOT NULL,"
           " integrity_score DOUBLE PRECISION NOT NULL,"
           " estimated_seconds INTEGER NOT NULL,"
           " success BOOLEAN NOT NULL,"
           " error TEXT NOT NULL DEFAULT '',"
           " recovery_time_ms BIGINT NOT NULL,"
           " created_at_ms BIGINT NOT NULL);",
           "CREATE INDEX IF NOT EXISTS automation_recoveries_session_idx ON automation_recoveries(session_id, created_at_ms);",
           "CREATE TABLE IF NOT EXISTS automation_steps ("
           " session_id TEXT NOT NULL,"
           " step_number BIGINT NOT NULL,"
           " route TEXT NOT NULL,"
           " action_type SMALLINT NOT NULL,"
           " selector TEXT NOT NULL,"
           " result_status SMALLINT NOT NULL,"
           " timing_ms BIGINT NOT NULL,"
           " retry_used BOOLEAN NOT NULL,"
           " reasoning TEXT NOT NULL DEFAULT '',"
           " evidence_ref TEXT NOT NULL DEFAULT '',"
           " created_at_ms BIGINT NOT NULL,"
           " PRIMARY KEY (session_id, step_number));",
       }},
  };
  return kMigrations;
}

} // namespace jobguard::db::sql
