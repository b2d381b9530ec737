#include "pg_repository.hpp"

#include <cstddef>

#include "internal/util/errors.hpp"

namespace jobguard::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

std::optional<Bytes> ToBytes(const std::optional<std::string>& v) {
  if (!v) return std::nullopt;
  return Bytes(reinterpret_cast<const std::byte*>(v->data()), v->size());
}

std::optional<std::string> FromBytes(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  auto raw = f.as<Bytes>();
  return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

template <typename T>
std::optional<T> OptionalField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return f.as<T>();
}

/*
  Reads return rows directly, so a serialization failure raised by the
  server mid-transaction is surfaced the same way a failed commit is.
*/
template <typename Fn>
auto Read(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(e.what());
  }
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id              = row[0].as<uint64_t>();
  r.idempotency_key = row[1].c_str();
  r.ticket_id       = row[2].as<int64_t>();
  r.operation_type  = row[3].c_str();
  r.status          = static_cast<jobguard::model::JobStatus>(row[4].as<int>());
  r.claimed_by      = row[5].c_str();
  r.claimed_at_ms   = row[6].as<uint64_t>();
  r.completed_at_ms = OptionalField<uint64_t>(row[7]);
  r.result          = FromBytes(row[8]);
  r.error_message   = row[9].c_str();
  r.retry_count     = row[10].as<uint32_t>();
  r.created_at_ms   = row[11].as<uint64_t>();
  r.updated_at_ms   = row[12].as<uint64_t>();
  return r;
}

model::CheckpointRecord ReadCheckpoint(const pqxx::row& row) {
  model::CheckpointRecord r;
  r.checkpoint_id   = row[0].c_str();
  r.session_id      = row[1].c_str();
  r.automation_type = row[2].c_str();
  r.current_step    = row[3].as<int64_t>();
  r.total_steps     = row[4].as<int64_t>();
  r.compression     = static_cast<jobguard::core::v1::CompressionType>(row[5].as<int>());
  r.data_size_bytes = row[6].as<uint64_t>();
  r.raw_size_bytes  = row[7].as<uint64_t>();
  r.checksum        = row[8].c_str();
  r.created_at_ms   = row[9].as<uint64_t>();
  return r;
}

model::SnapshotRecord ReadSnapshot(const pqxx::row& row) {
  model::SnapshotRecord r;
  r.snapshot_id     = row[0].c_str();
  r.session_id      = row[1].c_str();
  r.current_step    = OptionalField<int64_t>(row[2]);
  r.total_steps     = OptionalField<int64_t>(row[3]);
  r.compression     = static_cast<jobguard::core::v1::CompressionType>(row[4].as<int>());
  r.data_size_bytes = row[5].as<uint64_t>();
  r.raw_size_bytes  = row[6].as<uint64_t>();
  r.checksum        = row[7].c_str();
  r.created_at_ms   = row[8].as<uint64_t>();
  return r;
}

model::RecoveryRecord ReadRecovery(const pqxx::row& row) {
  model::RecoveryRecord r;
  r.recovery_id       = row[0].c_str();
  r.session_id        = row[1].c_str();
  r.target_id         = row[2].c_str();
  r.strategy          = row[3].c_str();
  r.status            = static_cast<uint8_t>(row[4].as<int>());
  r.confidence        = row[5].as<double>();
  r.integrity_score   = row[6].as<double>();
  r.estimated_seconds = row[7].as<uint32_t>();
  r.success           = row[8].as<bool>();
  r.error             = row[9].c_str();
  r.recovery_time_ms  = row[10].as<uint64_t>();
  r.created_at_ms     = row[11].as<uint64_t>();
  return r;
}

model::StepRecord ReadStep(const pqxx::row& row) {
  model::StepRecord r;
  r.session_id    = row[0].c_str();
  r.step_number   = row[1].as<uint64_t>();
  r.route         = row[2].c_str();
  r.action_type   = static_cast<jobguard::model::ActionType>(row[3].as<int>());
  r.selector      = row[4].c_str();
  r.result_status = static_cast<jobguard::model::StepStatus>(row[5].as<int>());
  r.timing_ms     = row[6].as<uint64_t>();
  r.retry_used    = row[7].as<bool>();
  r.reasoning     = row[8].c_str();
  r.evidence_ref  = row[9].c_str();
  r.created_at_ms = row[10].as<uint64_t>();
  return r;
}

template <typename Record, typename Reader>
std::vector<Record> ReadAll(const pqxx::result& res, Reader read) {
  std::vector<Record> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(read(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_job", r.idempotency_key, r.ticket_id, r.operation_type, static_cast<int>(r.status), r.claimed_by,
                                          r.claimed_at_ms, r.completed_at_ms, ToBytes(r.result), r.error_message, r.retry_count, r.created_at_ms,
                                          r.updated_at_ms);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, uint64_t id) {
  return Read([&]() -> std::optional<model::JobRecord> {
    auto res = TX(t).Work().exec_prepared("get_job", id);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  });
}

std::optional<model::JobRecord> PgRepository::GetJobByKey(Transaction& t, const std::string& key) {
  return Read([&]() -> std::optional<model::JobRecord> {
    auto res = TX(t).Work().exec_prepared("get_job_by_key", key);
    if (res.empty()) return std::nullopt;
    return ReadJob(res[0]);
  });
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.id, r.ticket_id, r.operation_type, static_cast<int>(r.status), r.claimed_by, r.claimed_at_ms,
                                          r.completed_at_ms, ToBytes(r.result), r.error_message, r.retry_count, r.updated_at_ms,
                                          r.idempotency_key);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListStaleJobs(Transaction& t, uint64_t claimed_before_ms) {
  return Read([&] { return ReadAll<model::JobRecord>(TX(t).Work().exec_prepared("list_stale_jobs", claimed_before_ms), ReadJob); });
}

Result PgRepository::DeleteTerminalJobs(Transaction& t, uint64_t updated_before_ms, uint64_t& deleted) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_terminal_jobs", updated_before_ms);
    deleted  = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Checkpoints
// ------------------------------------------------------------------

Result PgRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_checkpoint", r.checkpoint_id, r.session_id, r.automation_type, r.current_step, r.total_steps,
                               static_cast<int>(r.compression), r.data_size_bytes, r.raw_size_bytes, r.checksum, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CheckpointRecord> PgRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::CheckpointRecord> {
    auto res = TX(t).Work().exec_prepared("get_checkpoint", id);
    if (res.empty()) return std::nullopt;
    return ReadCheckpoint(res[0]);
  });
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpoints(Transaction& t, const std::string& session_id) {
  return Read([&] { return ReadAll<model::CheckpointRecord>(TX(t).Work().exec_prepared("list_checkpoints", session_id), ReadCheckpoint); });
}

std::vector<model::CheckpointRecord> PgRepository::ListCheckpointsBefore(Transaction& t, uint64_t created_before_ms) {
  return Read([&] { return ReadAll<model::CheckpointRecord>(TX(t).Work().exec_prepared("list_checkpoints_before", created_before_ms), ReadCheckpoint); });
}

Result PgRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_checkpoint", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_snapshot", r.snapshot_id, r.session_id, r.current_step, r.total_steps, static_cast<int>(r.compression),
                               r.data_size_bytes, r.raw_size_bytes, r.checksum, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SnapshotRecord> PgRepository::GetSnapshot(Transaction& t, const std::string& id) {
  return Read([&]() -> std::optional<model::SnapshotRecord> {
    auto res = TX(t).Work().exec_prepared("get_snapshot", id);
    if (res.empty()) return std::nullopt;
    return ReadSnapshot(res[0]);
  });
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshots(Transaction& t, const std::string& session_id) {
  return Read([&] { return ReadAll<model::SnapshotRecord>(TX(t).Work().exec_prepared("list_snapshots", session_id), ReadSnapshot); });
}

std::vector<model::SnapshotRecord> PgRepository::ListSnapshotsBefore(Transaction& t, uint64_t created_before_ms) {
  return Read([&] { return ReadAll<model::SnapshotRecord>(TX(t).Work().exec_prepared("list_snapshots_before", created_before_ms), ReadSnapshot); });
}

Result PgRepository::DeleteSnapshot(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_snapshot", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Recovery audit
// ------------------------------------------------------------------

Result PgRepository::InsertRecovery(Transaction& t, const model::RecoveryRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_recovery", r.recovery_id, r.session_id, r.target_id, r.strategy, static_cast<int>(r.status), r.confidence,
                               r.integrity_score, r.estimated_seconds, r.success, r.error, r.recovery_time_ms, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RecoveryRecord> PgRepository::ListRecoveries(Transaction& t, const std::string& session_id) {
  return Read([&] { return ReadAll<model::RecoveryRecord>(TX(t).Work().exec_prepared("list_recoveries", session_id), ReadRecovery); });
}

// ------------------------------------------------------------------
// Steps
// ------------------------------------------------------------------

Result PgRepository::AppendStep(Transaction& t, const model::StepRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_step", r.session_id, r.step_number, r.route, static_cast<int>(r.action_type), r.selector,
                               static_cast<int>(r.result_status), r.timing_ms, r.retry_used, r.reasoning, r.evidence_ref, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StepRecord> PgRepository::ListSteps(Transaction& t, const std::string& session_id) {
  return Read([&] { return ReadAll<model::StepRecord>(TX(t).Work().exec_prepared("list_steps", session_id), ReadStep); });
}

uint64_t PgRepository::MaxStepNumber(Transaction& t, const std::string& session_id) {
  return Read([&] { return TX(t).Work().exec_prepared1("max_step", session_id)[0].as<uint64_t>(); });
}

} // namespace jobguard::db::postgres
