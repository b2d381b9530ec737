#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/checkpoint_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/recovery_record.hpp"
#include "internal/db/model/snapshot_record.hpp"
#include "internal/db/model/step_record.hpp"

namespace jobguard::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A row read inside a transaction cannot be changed by another
    transaction before this one commits (or this commit fails with
    util::TransactionConflict)
  - Job claim mutual exclusion depends on this behavior

  The DB is the source of truth for:
    job ownership
    checkpoint / snapshot metadata
    recovery audit
    automation step history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Job ledger
  // ---------------------------------------------------------------------

  // Assigns record.id on success. AlreadyExists if the key is taken.
  virtual Result InsertJob(Transaction&, model::JobRecord& record) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::JobRecord> GetJobByKey(Transaction&, const std::string& idempotency_key) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord& record) = 0;

  // CLAIMED / PROCESSING rows claimed strictly before the cutoff.
  virtual std::vector<model::JobRecord> ListStaleJobs(Transaction&, uint64_t claimed_before_ms) = 0;

  // Deletes terminal rows last updated strictly before the cutoff.
  virtual Result DeleteTerminalJobs(Transaction&, uint64_t updated_before_ms, uint64_t& deleted) = 0;

  // ---------------------------------------------------------------------
  // Checkpoints
  // ---------------------------------------------------------------------

  virtual Result InsertCheckpoint(Transaction&, const model::CheckpointRecord&) = 0;

  virtual std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string& checkpoint_id) = 0;

  // Ordered by created_at_ms ascending.
  virtual std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::CheckpointRecord> ListCheckpointsBefore(Transaction&, uint64_t created_before_ms) = 0;

  virtual Result DeleteCheckpoint(Transaction&, const std::string& checkpoint_id) = 0;

  // ---------------------------------------------------------------------
  // Session snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) = 0;

  virtual std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string& snapshot_id) = 0;

  // Ordered by created_at_ms ascending.
  virtual std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::SnapshotRecord> ListSnapshotsBefore(Transaction&, uint64_t created_before_ms) = 0;

  virtual Result DeleteSnapshot(Transaction&, const std::string& snapshot_id) = 0;

  // ---------------------------------------------------------------------
  // Recovery audit
  // ---------------------------------------------------------------------

  virtual Result InsertRecovery(Transaction&, const model::RecoveryRecord&) = 0;

  // Ordered by created_at_ms ascending.
  virtual std::vector<model::RecoveryRecord> ListRecoveries(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Automation step log
  // ---------------------------------------------------------------------

  // AlreadyExists if (session_id, step_number) was used before.
  virtual Result AppendStep(Transaction&, const model::StepRecord&) = 0;

  // Ordered by step_number ascending.
  virtual std::vector<model::StepRecord> ListSteps(Transaction&, const std::string& session_id) = 0;

  // 0 when the session has no steps.
  virtual uint64_t MaxStepNumber(Transaction&, const std::string& session_id) = 0;
};

} // namespace jobguard::db
