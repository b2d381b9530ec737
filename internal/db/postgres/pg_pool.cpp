#include "pg_pool.hpp"

namespace jobguard::db::postgres {

namespace {

constexpr const char* kJobColumns =
    "id,idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
    "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms";

constexpr const char* kCheckpointColumns =
    "checkpoint_id,session_id,automation_type,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms";

constexpr const char* kSnapshotColumns =
    "snapshot_id,session_id,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms";

constexpr const char* kRecoveryColumns =
    "recovery_id,session_id,target_id,strategy,status,confidence,"
    "integrity_score,estimated_seconds,success,error,recovery_time_ms,created_at_ms";

constexpr const char* kStepColumns =
    "session_id,step_number,route,action_type,selector,result_status,"
    "timing_ms,retry_used,reasoning,evidence_ref,created_at_ms";

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // jobs
  conn.prepare("insert_job",
               "INSERT INTO automation_jobs(idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
               "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12) RETURNING id");
  // FOR UPDATE: a claim reads then rewrites the row in the same transaction
  conn.prepare("get_job", Select(kJobColumns, "FROM automation_jobs WHERE id=$1 FOR UPDATE"));
  conn.prepare("get_job_by_key", Select(kJobColumns, "FROM automation_jobs WHERE idempotency_key=$1 FOR UPDATE"));
  conn.prepare("update_job",
               "UPDATE automation_jobs SET ticket_id=$2,operation_type=$3,status=$4,claimed_by=$5,claimed_at_ms=$6,"
               "completed_at_ms=$7,result=$8,error_message=$9,retry_count=$10,updated_at_ms=$11 "
               "WHERE id=$1 AND idempotency_key=$12");
  conn.prepare("list_stale_jobs", Select(kJobColumns, "FROM automation_jobs WHERE status IN (2,3) AND claimed_at_ms<$1 ORDER BY id FOR UPDATE"));
  conn.prepare("delete_terminal_jobs", "DELETE FROM automation_jobs WHERE status IN (4,5,6,7) AND updated_at_ms<$1");

  // checkpoints
  conn.prepare("insert_checkpoint",
               "INSERT INTO automation_checkpoints(checkpoint_id,session_id,automation_type,current_step,total_steps,"
               "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10)");
  conn.prepare("get_checkpoint", Select(kCheckpointColumns, "FROM automation_checkpoints WHERE checkpoint_id=$1"));
  conn.prepare("list_checkpoints", Select(kCheckpointColumns, "FROM automation_checkpoints WHERE session_id=$1 ORDER BY created_at_ms,checkpoint_id"));
  conn.prepare("list_checkpoints_before", Select(kCheckpointColumns, "FROM automation_checkpoints WHERE created_at_ms<$1 ORDER BY created_at_ms,checkpoint_id"));
  conn.prepare("delete_checkpoint", "DELETE FROM automation_checkpoints WHERE checkpoint_id=$1");

  // snapshots
  conn.prepare("insert_snapshot",
               "INSERT INTO automation_snapshots(snapshot_id,session_id,current_step,total_steps,"
               "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");
  conn.prepare("get_snapshot", Select(kSnapshotColumns, "FROM automation_snapshots WHERE snapshot_id=$1"));
  conn.prepare("list_snapshots", Select(kSnapshotColumns, "FROM automation_snapshots WHERE session_id=$1 ORDER BY created_at_ms,snapshot_id"));
  conn.prepare("list_snapshots_before", Select(kSnapshotColumns, "FROM automation_snapshots WHERE created_at_ms<$1 ORDER BY created_at_ms,snapshot_id"));
  conn.prepare("delete_snapshot", "DELETE FROM automation_snapshots WHERE snapshot_id=$1");

  // recovery audit
  conn.prepare("insert_recovery",
               "INSERT INTO automation_recoveries(recovery_id,session_id,target_id,strategy,status,confidence,"
               "integrity_score,estimated_seconds,success,error,recovery_time_ms,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12)");
  conn.prepare("list_recoveries", Select(kRecoveryColumns, "FROM automation_recoveries WHERE session_id=$1 ORDER BY created_at_ms,recovery_id"));

  // steps
  conn.prepare("insert_step",
               "INSERT INTO automation_steps(session_id,step_number,route,action_type,selector,result_status,"
               "timing_ms,retry_used,reasoning,evidence_ref,created_at_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");
  conn.prepare("list_steps", Select(kStepColumns, "FROM automation_steps WHERE session_id=$1 ORDER BY step_number"));
  conn.prepare("max_step", "SELECT COALESCE(MAX(step_number),0) FROM automation_steps WHERE session_id=$1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    // broken connections are dropped, not recycled
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace jobguard::db::postgres
