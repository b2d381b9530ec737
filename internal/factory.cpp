#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/checkpoint/checkpoint_files.hpp"
#include "internal/claim/local_lock_table.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recovery/recovery_executor.hpp"
#include "internal/recovery/recovery_planner.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#if JOBGUARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if JOBGUARD_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace jobguard::factory {

using jobguard::runtime::config::DatabaseConfig;
using jobguard::runtime::config::RuntimeConfig;

namespace {

uint64_t AppliedAtMs() {
  return util::ToUnixMillis(util::Now());
}

#if JOBGUARD_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if JOBGUARD_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements
// against tables that must already exist.
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(const std::string& conninfo) : conn_(conninfo) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::nontransaction tx(conn_);
    tx.exec(sql);
  }

 private:
  pqxx::connection conn_;
};
#endif

std::chrono::seconds SecondsOr(uint32_t value, int64_t fallback) {
  return std::chrono::seconds(value > 0 ? value : fallback);
}

std::chrono::hours HoursOr(uint32_t value, int64_t fallback) {
  return std::chrono::hours(value > 0 ? value : fallback);
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();

  switch (database.backend_case()) {
    case DatabaseConfig::BACKEND_NOT_SET:
    case DatabaseConfig::kMemory:
      JOBGUARD_LOG_INFO("Using in-memory repository");
      return std::make_shared<db::memory::MemoryRepository>();

    case DatabaseConfig::kSqlite: {
#if JOBGUARD_DB_SQLITE
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());

      SqliteMigrationExecutor executor(*sqlite_db);
      db::sql::RunMigrations(executor, db::sql::SqliteMigrations(), AppliedAtMs());

      JOBGUARD_LOG_INFO("Using sqlite repository", {observability::StringField("path", database.sqlite().path())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
      throw util::InvalidArgument("jobguard was built without sqlite support");
#endif
    }

    case DatabaseConfig::kPostgres: {
#if JOBGUARD_DB_POSTGRES
      const auto& pg = database.postgres();
      {
        PostgresMigrationExecutor executor(pg.connection_uri());
        db::sql::RunMigrations(executor, db::sql::PostgresMigrations(), AppliedAtMs());
      }

      auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.pool_size() > 0 ? pg.pool_size() : 16);

      JOBGUARD_LOG_INFO("Using postgres repository", {observability::IntField("pool_size", pg.pool_size() > 0 ? pg.pool_size() : 16)});
      return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
      throw util::InvalidArgument("jobguard was built without postgres support");
#endif
    }
  }

  throw util::InvalidArgument("unknown database backend");
}

Application Build(const RuntimeConfig& config) {
  Application app;

  app.repository = BuildRepository(config);

  /*
    Checkpoints
  */
  const auto& checkpoints_cfg = config.checkpoints();
  auto        files           = std::make_shared<checkpoint::CheckpointFiles>(checkpoints_cfg.directory(), checkpoints_cfg.fsync());

  checkpoint::CheckpointStoreOptions checkpoint_options;
  if (checkpoints_cfg.compression() != core::v1::COMPRESSION_TYPE_UNSPECIFIED) checkpoint_options.compression = checkpoints_cfg.compression();
  if (checkpoints_cfg.max_per_session() > 0) checkpoint_options.max_per_session = checkpoints_cfg.max_per_session();

  app.checkpoints = std::make_shared<checkpoint::CheckpointStore>(app.repository, files, checkpoint_options);

  /*
    Claims
  */
  app.claims = std::make_shared<claim::ClaimStore>(app.repository, std::make_shared<claim::LocalLockTable>());

  /*
    Recovery + persistence
  */
  recovery::RecoveryPlannerOptions planner_options;
  if (config.recovery().max_recovery_options() > 0) planner_options.max_recovery_options = config.recovery().max_recovery_options();
  planner_options.max_recovery_age_days = config.recovery().max_recovery_age_days();

  auto planner  = std::make_shared<recovery::RecoveryPlanner>(app.checkpoints, planner_options);
  auto executor = std::make_shared<recovery::RecoveryExecutor>(app.checkpoints, app.repository);

  persistence::PersistenceOptions persistence_options;
  persistence_options.auto_checkpoint_interval = SecondsOr(config.persistence().auto_checkpoint_interval_seconds(), 300);

  app.coordinator = std::make_shared<persistence::PersistenceCoordinator>(app.checkpoints, planner, executor, persistence_options);

  /*
    Job runner
  */
  const auto& claims_cfg = config.claims();

  job::JobRunnerOptions runner_options;
  runner_options.worker_id     = claims_cfg.worker_id().empty() ? util::PrefixedId("worker_") : claims_cfg.worker_id();
  runner_options.claim_timeout = SecondsOr(claims_cfg.timeout_seconds(), 300);

  app.job_runner = std::make_shared<job::JobRunner>(app.claims, app.coordinator, app.repository, runner_options);

  /*
    Automation defaults
  */
  const auto& executor_cfg = config.executor();
  if (executor_cfg.max_retries() > 0) app.router_options.executor.max_retries = executor_cfg.max_retries();
  if (executor_cfg.backoff_base_ms() > 0) app.router_options.executor.backoff_base = std::chrono::milliseconds(executor_cfg.backoff_base_ms());
  app.router_options.executor.capture_evidence = executor_cfg.capture_evidence();
  if (executor_cfg.oracle_confidence_threshold() > 0) app.router_options.oracle_confidence_threshold = executor_cfg.oracle_confidence_threshold();
  if (executor_cfg.oracle_timeout_ms() > 0) app.router_options.oracle_timeout = std::chrono::milliseconds(executor_cfg.oracle_timeout_ms());
  if (executor_cfg.max_oracle_candidates() > 0) app.router_options.max_oracle_candidates = executor_cfg.max_oracle_candidates();

  /*
    Maintenance
  */
  maintenance::MaintenanceOptions maintenance_options;
  maintenance_options.interval             = SecondsOr(claims_cfg.sweep_interval_seconds(), 300);
  maintenance_options.stale_after          = HoursOr(claims_cfg.stale_after_hours(), 24);
  maintenance_options.job_retention        = HoursOr(claims_cfg.job_retention_days() * 24, 24 * 30);
  maintenance_options.checkpoint_retention = HoursOr(checkpoints_cfg.retention_days() * 24, 24 * 30);

  auto maintenance_worker = std::make_shared<maintenance::MaintenanceWorker>(app.claims, app.checkpoints, maintenance_options);
  maintenance_worker->Start();
  app.background_workers.push_back(maintenance_worker);

  /*
    Admin surface
  */
  service::ServiceContext ctx;
  ctx.claims               = app.claims;
  ctx.checkpoints          = app.checkpoints;
  ctx.coordinator          = app.coordinator;
  ctx.repository           = app.repository;
  ctx.stale_after          = maintenance_options.stale_after;
  ctx.checkpoint_retention = maintenance_options.checkpoint_retention;

  auto admin_service = std::make_shared<service::AdminService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  JOBGUARD_LOG_INFO("Application built", {observability::StringField("worker_id", runner_options.worker_id),
                                          observability::StringField("checkpoint_directory", checkpoints_cfg.directory())});
  return app;
}

} // namespace jobguard::factory
