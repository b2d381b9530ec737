#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace jobguard::db::sqlite {

using jobguard::db::ErrorCode;
using jobguard::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptBlob(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    sqlite3_bind_blob(st, idx, v->data(), static_cast<int>(v->size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptBlob(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  const void* data = sqlite3_column_blob(st, col);
  int         size = sqlite3_column_bytes(st, col);
  if (!data || size == 0) return std::string();
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

// Reads must not silently return "no row" on a database failure.
void ThrowStep(sqlite3* db, int rc) {
  throw std::runtime_error(std::string("sqlite step failed (") + std::to_string(rc) + "): " + sqlite3_errmsg(db));
}

model::JobRecord ReadJob(sqlite3_stmt* st) {
  model::JobRecord r;
  r.id              = ColU64(st, 0);
  r.idempotency_key = ColText(st, 1);
  r.ticket_id       = ColI64(st, 2);
  r.operation_type  = ColText(st, 3);
  r.status          = static_cast<jobguard::model::JobStatus>(ColI32(st, 4));
  r.claimed_by      = ColText(st, 5);
  r.claimed_at_ms   = ColU64(st, 6);
  if (!IsNull(st, 7)) r.completed_at_ms = ColU64(st, 7);
  r.result        = ColOptBlob(st, 8);
  r.error_message = ColText(st, 9);
  r.retry_count   = static_cast<uint32_t>(ColI32(st, 10));
  r.created_at_ms = ColU64(st, 11);
  r.updated_at_ms = ColU64(st, 12);
  return r;
}

model::CheckpointRecord ReadCheckpoint(sqlite3_stmt* st) {
  model::CheckpointRecord r;
  r.checkpoint_id   = ColText(st, 0);
  r.session_id      = ColText(st, 1);
  r.automation_type = ColText(st, 2);
  r.current_step    = ColI64(st, 3);
  r.total_steps     = ColI64(st, 4);
  r.compression     = static_cast<jobguard::core::v1::CompressionType>(ColI32(st, 5));
  r.data_size_bytes = ColU64(st, 6);
  r.raw_size_bytes  = ColU64(st, 7);
  r.checksum        = ColText(st, 8);
  r.created_at_ms   = ColU64(st, 9);
  return r;
}

model::SnapshotRecord ReadSnapshot(sqlite3_stmt* st) {
  model::SnapshotRecord r;
  r.snapshot_id = ColText(st, 0);
  r.session_id  = ColText(st, 1);
  if (!IsNull(st, 2)) r.current_step = ColI64(st, 2);
  if (!IsNull(st, 3)) r.total_steps = ColI64(st, 3);
  r.compression     = static_cast<jobguard::core::v1::CompressionType>(ColI32(st, 4));
  r.data_size_bytes = ColU64(st, 5);
  r.raw_size_bytes  = ColU64(st, 6);
  r.checksum        = ColText(st, 7);
  r.created_at_ms   = ColU64(st, 8);
  return r;
}

model::RecoveryRecord ReadRecovery(sqlite3_stmt* st) {
  model::RecoveryRecord r;
  r.recovery_id       = ColText(st, 0);
  r.session_id        = ColText(st, 1);
  r.target_id         = ColText(st, 2);
  r.strategy          = ColText(st, 3);
  r.status            = static_cast<uint8_t>(ColI32(st, 4));
  r.confidence        = sqlite3_column_double(st, 5);
  r.integrity_score   = sqlite3_column_double(st, 6);
  r.estimated_seconds = static_cast<uint32_t>(ColI64(st, 7));
  r.success           = ColI32(st, 8) != 0;
  r.error             = ColText(st, 9);
  r.recovery_time_ms  = ColU64(st, 10);
  r.created_at_ms     = ColU64(st, 11);
  return r;
}

model::StepRecord ReadStep(sqlite3_stmt* st) {
  model::StepRecord r;
  r.session_id    = ColText(st, 0);
  r.step_number   = ColU64(st, 1);
  r.route         = ColText(st, 2);
  r.action_type   = static_cast<jobguard::model::ActionType>(ColI32(st, 3));
  r.selector      = ColText(st, 4);
  r.result_status = static_cast<jobguard::model::StepStatus>(ColI32(st, 5));
  r.timing_ms     = ColU64(st, 6);
  r.retry_used    = ColI32(st, 7) != 0;
  r.reasoning     = ColText(st, 8);
  r.evidence_ref  = ColText(st, 9);
  r.created_at_ms = ColU64(st, 10);
  return r;
}

template <typename Record, typename Reader>
std::optional<Record> QueryOne(sqlite3* db, sqlite3_stmt* st, Reader read) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStep(db, rc);
  return read(st);
}

template <typename Record, typename Reader>
std::vector<Record> QueryAll(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Record> out;
  for (;;) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) ThrowStep(db, rc);
    out.push_back(read(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_UNIQUE || extended == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::INSERT_JOB);

  BindText(st.get(), 1, r.idempotency_key);
  BindI64(st.get(), 2, r.ticket_id);
  BindText(st.get(), 3, r.operation_type);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindText(st.get(), 5, r.claimed_by);
  BindU64(st.get(), 6, r.claimed_at_ms);
  BindOptU64(st.get(), 7, r.completed_at_ms);
  BindOptBlob(st.get(), 8, r.result);
  BindText(st.get(), 9, r.error_message);
  BindI32(st.get(), 10, static_cast<int>(r.retry_count));
  BindU64(st.get(), 11, r.created_at_ms);
  BindU64(st.get(), 12, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db.Handle()));
  return Result::Ok();
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, uint64_t id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_JOB_BY_ID);
  BindU64(st.get(), 1, id);
  return QueryOne<model::JobRecord>(db.Handle(), st.get(), ReadJob);
}

std::optional<model::JobRecord> SqliteRepository::GetJobByKey(Transaction& t, const std::string& key) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_JOB_BY_KEY);
  BindText(st.get(), 1, key);
  return QueryOne<model::JobRecord>(db.Handle(), st.get(), ReadJob);
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::UPDATE_JOB);

  BindI64(st.get(), 1, r.ticket_id);
  BindText(st.get(), 2, r.operation_type);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindText(st.get(), 4, r.claimed_by);
  BindU64(st.get(), 5, r.claimed_at_ms);
  BindOptU64(st.get(), 6, r.completed_at_ms);
  BindOptBlob(st.get(), 7, r.result);
  BindText(st.get(), 8, r.error_message);
  BindI32(st.get(), 9, static_cast<int>(r.retry_count));
  BindU64(st.get(), 10, r.updated_at_ms);
  BindU64(st.get(), 11, r.id);
  BindText(st.get(), 12, r.idempotency_key);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
  if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::JobRecord> SqliteRepository::ListStaleJobs(Transaction& t, uint64_t claimed_before_ms) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_STALE_JOBS);
  BindU64(st.get(), 1, claimed_before_ms);
  return QueryAll<model::JobRecord>(db.Handle(), st.get(), ReadJob);
}

Result SqliteRepository::DeleteTerminalJobs(Transaction& t, uint64_t updated_before_ms, uint64_t& deleted) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::DELETE_TERMINAL_JOBS);
  BindU64(st.get(), 1, updated_before_ms);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
  deleted = static_cast<uint64_t>(sqlite3_changes(db.Handle()));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result SqliteRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::INSERT_CHECKPOINT);

  BindText(st.get(), 1, r.checkpoint_id);
  BindText(st.get(), 2, r.session_id);
  BindText(st.get(), 3, r.automation_type);
  BindI64(st.get(), 4, r.current_step);
  BindI64(st.get(), 5, r.total_steps);
  BindI32(st.get(), 6, static_cast<int>(r.compression));
  BindU64(st.get(), 7, r.data_size_bytes);
  BindU64(st.get(), 8, r.raw_size_bytes);
  BindText(st.get(), 9, r.checksum);
  BindU64(st.get(), 10, r.created_at_ms);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::optional<model::CheckpointRecord> SqliteRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_CHECKPOINT);
  BindText(st.get(), 1, id);
  return QueryOne<model::CheckpointRecord>(db.Handle(), st.get(), ReadCheckpoint);
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpoints(Transaction& t, const std::string& session_id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SESSION_CHECKPOINTS);
  BindText(st.get(), 1, session_id);
  return QueryAll<model::CheckpointRecord>(db.Handle(), st.get(), ReadCheckpoint);
}

std::vector<model::CheckpointRecord> SqliteRepository::ListCheckpointsBefore(Transaction& t, uint64_t created_before_ms) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_CHECKPOINTS_BEFORE);
  BindU64(st.get(), 1, created_before_ms);
  return QueryAll<model::CheckpointRecord>(db.Handle(), st.get(), ReadCheckpoint);
}

Result SqliteRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::DELETE_CHECKPOINT);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
  if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::INSERT_SNAPSHOT);

  BindText(st.get(), 1, r.snapshot_id);
  BindText(st.get(), 2, r.session_id);
  BindOptI64(st.get(), 3, r.current_step);
  BindOptI64(st.get(), 4, r.total_steps);
  BindI32(st.get(), 5, static_cast<int>(r.compression));
  BindU64(st.get(), 6, r.data_size_bytes);
  BindU64(st.get(), 7, r.raw_size_bytes);
  BindText(st.get(), 8, r.checksum);
  BindU64(st.get(), 9, r.created_at_ms);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::optional<model::SnapshotRecord> SqliteRepository::GetSnapshot(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SNAPSHOT);
  BindText(st.get(), 1, id);
  return QueryOne<model::SnapshotRecord>(db.Handle(), st.get(), ReadSnapshot);
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshots(Transaction& t, const std::string& session_id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SESSION_SNAPSHOTS);
  BindText(st.get(), 1, session_id);
  return QueryAll<model::SnapshotRecord>(db.Handle(), st.get(), ReadSnapshot);
}

std::vector<model::SnapshotRecord> SqliteRepository::ListSnapshotsBefore(Transaction& t, uint64_t created_before_ms) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SNAPSHOTS_BEFORE);
  BindU64(st.get(), 1, created_before_ms);
  return QueryAll<model::SnapshotRecord>(db.Handle(), st.get(), ReadSnapshot);
}

Result SqliteRepository::DeleteSnapshot(Transaction& t, const std::string& id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::DELETE_SNAPSHOT);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db.Handle(), rc);
  if (sqlite3_changes(db.Handle()) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Recovery audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertRecovery(Transaction& t, const model::RecoveryRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::INSERT_RECOVERY);

  BindText(st.get(), 1, r.recovery_id);
  BindText(st.get(), 2, r.session_id);
  BindText(st.get(), 3, r.target_id);
  BindText(st.get(), 4, r.strategy);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  sqlite3_bind_double(st.get(), 6, r.confidence);
  sqlite3_bind_double(st.get(), 7, r.integrity_score);
  BindU64(st.get(), 8, r.estimated_seconds);
  BindI32(st.get(), 9, r.success ? 1 : 0);
  BindText(st.get(), 10, r.error);
  BindU64(st.get(), 11, r.recovery_time_ms);
  BindU64(st.get(), 12, r.created_at_ms);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::vector<model::RecoveryRecord> SqliteRepository::ListRecoveries(Transaction& t, const std::string& session_id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SESSION_RECOVERIES);
  BindText(st.get(), 1, session_id);
  return QueryAll<model::RecoveryRecord>(db.Handle(), st.get(), ReadRecovery);
}

// ------------------------------------------------------------------
// Steps
// ------------------------------------------------------------------

Result SqliteRepository::AppendStep(Transaction& t, const model::StepRecord& r) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::INSERT_STEP);

  BindText(st.get(), 1, r.session_id);
  BindU64(st.get(), 2, r.step_number);
  BindText(st.get(), 3, r.route);
  BindI32(st.get(), 4, static_cast<int>(r.action_type));
  BindText(st.get(), 5, r.selector);
  BindI32(st.get(), 6, static_cast<int>(r.result_status));
  BindU64(st.get(), 7, r.timing_ms);
  BindI32(st.get(), 8, r.retry_used ? 1 : 0);
  BindText(st.get(), 9, r.reasoning);
  BindText(st.get(), 10, r.evidence_ref);
  BindU64(st.get(), 11, r.created_at_ms);

  return Translate(db.Handle(), sqlite3_step(st.get()));
}

std::vector<model::StepRecord> SqliteRepository::ListSteps(Transaction& t, const std::string& session_id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_SESSION_STEPS);
  BindText(st.get(), 1, session_id);
  return QueryAll<model::StepRecord>(db.Handle(), st.get(), ReadStep);
}

uint64_t SqliteRepository::MaxStepNumber(Transaction& t, const std::string& session_id) {
  auto& db = TX(t).DB();
  auto  st = db.Prepare(sql::SELECT_MAX_STEP);
  BindText(st.get(), 1, session_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_ROW) ThrowStep(db.Handle(), rc);
  return ColU64(st.get(), 0);
}

} // namespace jobguard::db::sqlite
