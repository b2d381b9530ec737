#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/util/errors.hpp"

#if JOBGUARD_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if JOBGUARD_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using jobguard::db::ErrorCode;
using jobguard::db::Repository;
using jobguard::db::memory::MemoryRepository;
using jobguard::db::model::CheckpointRecord;
using jobguard::db::model::JobRecord;
using jobguard::db::model::RecoveryRecord;
using jobguard::db::model::SnapshotRecord;
using jobguard::db::model::StepRecord;
using jobguard::model::JobStatus;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

JobRecord NewJob(const std::string& key, JobStatus status, uint64_t claimed_at_ms) {
  JobRecord job;
  job.idempotency_key = key;
  job.ticket_id       = 42;
  job.operation_type  = "invoice_portal";
  job.status          = status;
  job.claimed_by      = "worker-a";
  job.claimed_at_ms   = claimed_at_ms;
  job.created_at_ms   = claimed_at_ms;
  job.updated_at_ms   = claimed_at_ms;
  return job;
}

// A failed statement poisons a Postgres transaction, so it gets its own.
void ExpectDuplicate(Repository& repo, const std::function<jobguard::db::Result(jobguard::db::Transaction&)>& write) {
  auto tx     = repo.Begin();
  auto result = write(*tx);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyJobLedger(Repository& repo, const std::string& prefix) {
  auto job = NewJob(prefix + ":job", JobStatus::kClaimed, 1000);
  {
    auto tx     = repo.Begin();
    auto insert = repo.InsertJob(*tx, job);
    assert(insert);
    assert(job.id != 0);
    tx->Commit();
  }

  ExpectDuplicate(repo, [&](jobguard::db::Transaction& tx) {
    auto duplicate = NewJob(prefix + ":job", JobStatus::kClaimed, 1000);
    return repo.InsertJob(tx, duplicate);
  });

  auto tx    = repo.Begin();
  auto by_id = repo.GetJob(*tx, job.id);
  assert(by_id);
  assert(by_id->idempotency_key == prefix + ":job");
  assert(by_id->status == JobStatus::kClaimed);
  assert(!by_id->completed_at_ms);
  assert(!by_id->result);

  by_id->status          = JobStatus::kCompleted;
  by_id->completed_at_ms = 2000;
  by_id->result          = std::string("\x0a\x02ok", 4);
  by_id->retry_count     = 2;
  by_id->updated_at_ms   = 2000;
  assert(repo.UpdateJob(*tx, *by_id));

  auto by_key = repo.GetJobByKey(*tx, prefix + ":job");
  assert(by_key);
  assert(by_key->id == job.id);
  assert(by_key->status == JobStatus::kCompleted);
  assert(by_key->completed_at_ms == 2000u);
  assert(by_key->result == std::string("\x0a\x02ok", 4));
  assert(by_key->retry_count == 2);

  assert(!repo.GetJob(*tx, job.id + 1000));
  assert(!repo.GetJobByKey(*tx, prefix + ":missing"));
  tx->Commit();
}

void VerifyStaleAndPurge(Repository& repo, const std::string& prefix) {
  {
    auto tx      = repo.Begin();
    auto stale   = NewJob(prefix + ":stale", JobStatus::kProcessing, 100);
    auto fresh   = NewJob(prefix + ":fresh", JobStatus::kClaimed, 5000);
    auto pending = NewJob(prefix + ":done", JobStatus::kFailed, 100);
    assert(repo.InsertJob(*tx, stale));
    assert(repo.InsertJob(*tx, fresh));
    assert(repo.InsertJob(*tx, pending));
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto rows = repo.ListStaleJobs(*tx, 1000);
    bool seen = false;
    for (const auto& row : rows) {
      assert(row.status == JobStatus::kClaimed || row.status == JobStatus::kProcessing);
      assert(row.claimed_at_ms < 1000);
      if (row.idempotency_key == prefix + ":stale") seen = true;
      assert(row.idempotency_key != prefix + ":fresh");
    }
    assert(seen);

    uint64_t deleted = 0;
    assert(repo.DeleteTerminalJobs(*tx, 1000, deleted));
    assert(deleted >= 1);
    assert(!repo.GetJobByKey(*tx, prefix + ":done"));
    assert(repo.GetJobByKey(*tx, prefix + ":stale"));
    tx->Commit();
  }
}

void VerifyCheckpointsAndSnapshots(Repository& repo, const std::string& prefix) {
  const auto session = prefix + "-session";
  auto       tx      = repo.Begin();

  for (int i = 0; i < 3; ++i) {
    CheckpointRecord checkpoint;
    checkpoint.checkpoint_id   = prefix + "-chk-" + std::to_string(i);
    checkpoint.session_id      = session;
    checkpoint.automation_type = "invoice_portal";
    checkpoint.current_step    = i + 1;
    checkpoint.total_steps     = 5;
    checkpoint.compression     = jobguard::core::v1::COMPRESSION_TYPE_GZIP;
    checkpoint.data_size_bytes = 100 + i;
    checkpoint.raw_size_bytes  = 300 + i;
    checkpoint.checksum        = std::string(64, static_cast<char>('a' + i));
    checkpoint.created_at_ms   = 1000 + static_cast<uint64_t>(i) * 10;
    assert(repo.InsertCheckpoint(*tx, checkpoint));
  }

  const auto listed = repo.ListCheckpoints(*tx, session);
  assert(listed.size() == 3);
  assert(listed.front().checkpoint_id == prefix + "-chk-0");
  assert(listed.back().created_at_ms == 1020);
  assert(listed.back().compression == jobguard::core::v1::COMPRESSION_TYPE_GZIP);
  assert(listed.back().raw_size_bytes == 302);

  const auto one = repo.GetCheckpoint(*tx, prefix + "-chk-1");
  assert(one && one->current_step == 2 && one->checksum == std::string(64, 'b'));

  const auto old = repo.ListCheckpointsBefore(*tx, 1010);
  bool       found_oldest = false;
  for (const auto& row : old) {
    assert(row.created_at_ms < 1010);
    if (row.checkpoint_id == prefix + "-chk-0") found_oldest = true;
  }
  assert(found_oldest);

  assert(repo.DeleteCheckpoint(*tx, prefix + "-chk-0"));
  assert(repo.ListCheckpoints(*tx, session).size() == 2);

  SnapshotRecord with_steps;
  with_steps.snapshot_id     = prefix + "-snap-0";
  with_steps.session_id      = session;
  with_steps.current_step    = 4;
  with_steps.total_steps     = 5;
  with_steps.compression     = jobguard::core::v1::COMPRESSION_TYPE_ZSTD;
  with_steps.data_size_bytes = 512;
  with_steps.raw_size_bytes  = 2048;
  with_steps.checksum        = std::string(64, 'f');
  with_steps.created_at_ms   = 1500;
  assert(repo.InsertSnapshot(*tx, with_steps));

  SnapshotRecord without_steps = with_steps;
  without_steps.snapshot_id    = prefix + "-snap-1";
  without_steps.current_step.reset();
  without_steps.total_steps.reset();
  without_steps.created_at_ms = 1600;
  assert(repo.InsertSnapshot(*tx, without_steps));

  const auto snapshots = repo.ListSnapshots(*tx, session);
  assert(snapshots.size() == 2);
  assert(snapshots[0].current_step == 4);
  assert(!snapshots[1].current_step);

  assert(repo.GetSnapshot(*tx, prefix + "-snap-1"));
  assert(!repo.ListSnapshotsBefore(*tx, 1550).empty());
  assert(repo.DeleteSnapshot(*tx, prefix + "-snap-0"));
  assert(!repo.GetSnapshot(*tx, prefix + "-snap-0"));
  tx->Commit();
}

void VerifyRecoveryAuditAndSteps(Repository& repo, const std::string& prefix) {
  const auto session = prefix + "-audit";
  auto       tx      = repo.Begin();

  RecoveryRecord audit;
  audit.recovery_id       = prefix + "-rec-0";
  audit.session_id        = session;
  audit.target_id         = prefix + "-chk-2";
  audit.strategy          = "direct_checkpoint_recovery";
  audit.status            = 1;
  audit.confidence        = 0.95;
  audit.integrity_score   = 1.0;
  audit.estimated_seconds = 30;
  audit.success           = true;
  audit.recovery_time_ms  = 12;
  audit.created_at_ms     = NowMs();
  assert(repo.InsertRecovery(*tx, audit));

  const auto recoveries = repo.ListRecoveries(*tx, session);
  assert(recoveries.size() == 1);
  assert(recoveries[0].success);
  assert(recoveries[0].confidence == 0.95);
  assert(recoveries[0].strategy == "direct_checkpoint_recovery");

  assert(repo.MaxStepNumber(*tx, session) == 0);

  StepRecord step;
  step.session_id    = session;
  step.step_number   = 1;
  step.route         = "primary";
  step.action_type   = jobguard::model::ActionType::kClick;
  step.selector      = "#download";
  step.result_status = jobguard::model::StepStatus::kNotVisible;
  step.timing_ms     = 25;
  step.created_at_ms = NowMs();
  assert(repo.AppendStep(*tx, step));

  step.step_number   = 2;
  step.route         = "fallback";
  step.result_status = jobguard::model::StepStatus::kSuccess;
  step.retry_used    = true;
  step.reasoning     = "primary hidden";
  assert(repo.AppendStep(*tx, step));
  tx->Commit();
  tx.reset();

  ExpectDuplicate(repo, [&](jobguard::db::Transaction& dup_tx) { return repo.AppendStep(dup_tx, step); });

  tx               = repo.Begin();
  const auto steps = repo.ListSteps(*tx, session);
  assert(steps.size() == 2);
  assert(steps[0].result_status == jobguard::model::StepStatus::kNotVisible);
  assert(steps[1].retry_used);
  assert(steps[1].reasoning == "primary hidden");
  assert(repo.MaxStepNumber(*tx, session) == 2);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx  = repo.Begin();
    auto job = NewJob(prefix + ":rollback", JobStatus::kClaimed, 1000);
    assert(repo.InsertJob(*tx, job));
    tx->Rollback();
  }

  {
    auto tx  = repo.Begin();
    auto job = NewJob(prefix + ":dropped", JobStatus::kClaimed, 1000);
    assert(repo.InsertJob(*tx, job));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetJobByKey(*check_tx, prefix + ":rollback"));
  assert(!repo.GetJobByKey(*check_tx, prefix + ":dropped"));
  check_tx->Commit();
}

void VerifyConcurrentClaim(Repository& repo, const std::string& prefix, bool supports_parallel_transactions) {
  uint64_t id = 0;
  {
    auto tx  = repo.Begin();
    auto job = NewJob(prefix + ":contended", JobStatus::kTimeout, 1000);
    assert(repo.InsertJob(*tx, job));
    id = job.id;
    tx->Commit();
  }

  if (!supports_parallel_transactions) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetJob(*tx1, id);
  auto r2 = repo.GetJob(*tx2, id);
  assert(r1 && r2);

  r1->status     = JobStatus::kClaimed;
  r1->claimed_by = "worker-1";
  r2->status     = JobStatus::kClaimed;
  r2->claimed_by = "worker-2";

  assert(repo.UpdateJob(*tx1, *r1));
  tx1->Commit();

  bool conflict = false;
  try {
    auto update = repo.UpdateJob(*tx2, *r2);
    if (!update) {
      conflict = update.IsConflict();
    } else {
      tx2->Commit();
    }
  } catch (const jobguard::util::TransactionConflict&) {
    conflict = true;
  }
  assert(conflict);

  auto verify_tx = repo.Begin();
  auto final     = repo.GetJob(*verify_tx, id);
  assert(final && final->claimed_by == "worker-1");
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx  = repo->Begin();
    auto job = NewJob(prefix + ":durable", JobStatus::kCompleted, 1000);
    job.result = std::string("payload");
    assert(repo->InsertJob(*tx, job));

    StepRecord step;
    step.session_id    = prefix + "-durable";
    step.step_number   = 1;
    step.route         = "primary";
    step.action_type   = jobguard::model::ActionType::kSubmit;
    step.result_status = jobguard::model::StepStatus::kSuccess;
    step.created_at_ms = NowMs();
    assert(repo->AppendStep(*tx, step));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto job = repo->GetJobByKey(*tx, prefix + ":durable");
  assert(job);
  assert(job->status == JobStatus::kCompleted);
  assert(job->result == std::string("payload"));
  assert(repo->MaxStepNumber(*tx, prefix + "-durable") == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if JOBGUARD_DB_SQLITE
class SqliteExecutor final : public jobguard::db::sql::MigrationExecutor {
 public:
  explicit SqliteExecutor(jobguard::db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  jobguard::db::sqlite::SqliteDB& db_;
};

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("jobguard_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto           db = std::make_shared<jobguard::db::sqlite::SqliteDB>(db_path);
    SqliteExecutor executor(*db);
    jobguard::db::sql::RunMigrations(executor, jobguard::db::sql::SqliteMigrations(), NowMs());
    return std::make_shared<jobguard::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

#if JOBGUARD_DB_POSTGRES
class PostgresExecutor final : public jobguard::db::sql::MigrationExecutor {
 public:
  explicit PostgresExecutor(const std::string& conninfo) : conn_(conninfo) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::nontransaction tx(conn_);
    tx.exec(sql);
  }

 private:
  pqxx::connection conn_;
};

BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("JOBGUARD_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("JOBGUARD_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    {
      PostgresExecutor executor(conninfo);
      jobguard::db::sql::RunMigrations(executor, jobguard::db::sql::PostgresMigrations(), NowMs());
    }
    return std::make_shared<jobguard::db::postgres::PgRepository>(std::make_shared<jobguard::db::postgres::PgPool>(conninfo));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      // Reads take row locks; a second reader on this thread would wait forever.
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyJobLedger(*repo, prefix + "-ledger");
  VerifyStaleAndPurge(*repo, prefix + "-sweep");
  VerifyCheckpointsAndSnapshots(*repo, prefix + "-files");
  VerifyRecoveryAuditAndSteps(*repo, prefix + "-audit");
  VerifyRollbackBehavior(*repo, prefix + "-rollback");
  VerifyConcurrentClaim(*repo, prefix + "-concurrency", backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, prefix + "-restart");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if JOBGUARD_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if JOBGUARD_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "jobguard_integration_repository_parity: pass\n";
  return 0;
}
