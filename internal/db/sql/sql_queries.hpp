#pragma once

namespace jobguard::db::sql {

/*
  Canonical SQL for the SQLite backend ('?' placeholders).

  Column order here is the order the repository binds and reads.
  The Postgres backend prepares the same statements with $N
  placeholders in PgPool::PrepareStatements.
*/

// jobs

static constexpr const char* INSERT_JOB =
    "INSERT INTO automation_jobs(idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
    "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_JOB_BY_ID =
    "SELECT id,idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
    "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms"
    " FROM automation_jobs WHERE id=?;";

static constexpr const char* SELECT_JOB_BY_KEY =
    "SELECT id,idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
    "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms"
    " FROM automation_jobs WHERE idempotency_key=?;";

static constexpr const char* UPDATE_JOB =
    "UPDATE automation_jobs SET ticket_id=?,operation_type=?,status=?,claimed_by=?,claimed_at_ms=?,"
    "completed_at_ms=?,result=?,error_message=?,retry_count=?,updated_at_ms=?"
    " WHERE id=? AND idempotency_key=?;";

static constexpr const char* SELECT_STALE_JOBS =
    "SELECT id,idempotency_key,ticket_id,operation_type,status,claimed_by,claimed_at_ms,"
    "completed_at_ms,result,error_message,retry_count,created_at_ms,updated_at_ms"
    " FROM automation_jobs WHERE status IN (2,3) AND claimed_at_ms<? ORDER BY id;";

static constexpr const char* DELETE_TERMINAL_JOBS =
    "DELETE FROM automation_jobs WHERE status IN (4,5,6,7) AND updated_at_ms<?;";

// checkpoints

static constexpr const char* INSERT_CHECKPOINT =
    "INSERT INTO automation_checkpoints(checkpoint_id,session_id,automation_type,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CHECKPOINT =
    "SELECT checkpoint_id,session_id,automation_type,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_checkpoints WHERE checkpoint_id=?;";

static constexpr const char* SELECT_SESSION_CHECKPOINTS =
    "SELECT checkpoint_id,session_id,automation_type,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_checkpoints WHERE session_id=? ORDER BY created_at_ms,checkpoint_id;";

static constexpr const char* SELECT_CHECKPOINTS_BEFORE =
    "SELECT checkpoint_id,session_id,automation_type,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_checkpoints WHERE created_at_ms<? ORDER BY created_at_ms,checkpoint_id;";

static constexpr const char* DELETE_CHECKPOINT =
    "DELETE FROM automation_checkpoints WHERE checkpoint_id=?;";

// snapshots

static constexpr const char* INSERT_SNAPSHOT =
    "INSERT INTO automation_snapshots(snapshot_id,session_id,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SNAPSHOT =
    "SELECT snapshot_id,session_id,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_snapshots WHERE snapshot_id=?;";

static constexpr const char* SELECT_SESSION_SNAPSHOTS =
    "SELECT snapshot_id,session_id,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_snapshots WHERE session_id=? ORDER BY created_at_ms,snapshot_id;";

static constexpr const char* SELECT_SNAPSHOTS_BEFORE =
    "SELECT snapshot_id,session_id,current_step,total_steps,"
    "compression,data_size_bytes,raw_size_bytes,checksum,created_at_ms"
    " FROM automation_snapshots WHERE created_at_ms<? ORDER BY created_at_ms,snapshot_id;";

static constexpr const char* DELETE_SNAPSHOT =
    "DELETE FROM automation_snapshots WHERE snapshot_id=?;";

// recovery audit

static constexpr const char* INSERT_RECOVERY =
    "INSERT INTO automation_recoveries(recovery_id,session_id,target_id,strategy,status,confidence,"
    "integrity_score,estimated_seconds,success,error,recovery_time_ms,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SESSION_RECOVERIES =
    "SELECT recovery_id,session_id,target_id,strategy,status,confidence,"
    "integrity_score,estimated_seconds,success,error,recovery_time_ms,created_at_ms"
    " FROM automation_recoveries WHERE session_id=? ORDER BY created_at_ms,recovery_id;";

// steps

static constexpr const char* INSERT_STEP =
    "INSERT INTO automation_steps(session_id,step_number,route,action_type,selector,result_status,"
    "timing_ms,retry_used,reasoning,evidence_ref,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SESSION_STEPS =
    "SELECT session_id,step_number,route,action_type,selector,result_status,"
    "timing_ms,retry_used,reasoning,evidence_ref,created_at_ms"
    " FROM automation_steps WHERE session_id=? ORDER BY step_number;";

static constexpr const char* SELECT_MAX_STEP =
    "SELECT COALESCE(MAX(step_number),0) FROM automation_steps WHERE session_id=?;";

} // namespace jobguard::db::sql
