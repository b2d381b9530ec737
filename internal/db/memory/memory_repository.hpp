#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace jobguard::db::memory {

class MemoryTransaction;

/*
  In-process backend for tests and single-node deployments without a
  database. Transactions copy the committed state and commit only if no
  other writer committed in between.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t) override;
  std::optional<model::JobRecord> GetJobByKey(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  std::vector<model::JobRecord> ListStaleJobs(Transaction&, uint64_t) override;
  Result DeleteTerminalJobs(Transaction&, uint64_t, uint64_t&) override;

  Result InsertCheckpoint(Transaction&, const model::CheckpointRecord&) override;
  std::optional<model::CheckpointRecord> GetCheckpoint(Transaction&, const std::string&) override;
  std::vector<model::CheckpointRecord> ListCheckpoints(Transaction&, const std::string&) override;
  std::vector<model::CheckpointRecord> ListCheckpointsBefore(Transaction&, uint64_t) override;
  Result DeleteCheckpoint(Transaction&, const std::string&) override;

  Result InsertSnapshot(Transaction&, const model::SnapshotRecord&) override;
  std::optional<model::SnapshotRecord> GetSnapshot(Transaction&, const std::string&) override;
  std::vector<model::SnapshotRecord> ListSnapshots(Transaction&, const std::string&) override;
  std::vector<model::SnapshotRecord> ListSnapshotsBefore(Transaction&, uint64_t) override;
  Result DeleteSnapshot(Transaction&, const std::string&) override;

  Result InsertRecovery(Transaction&, const model::RecoveryRecord&) override;
  std::vector<model::RecoveryRecord> ListRecoveries(Transaction&, const std::string&) override;

  Result AppendStep(Transaction&, const model::StepRecord&) override;
  std::vector<model::StepRecord> ListSteps(Transaction&, const std::string&) override;
  uint64_t MaxStepNumber(Transaction&, const std::string&) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<uint64_t, model::JobRecord> jobs;
    std::unordered_map<std::string, uint64_t>      job_by_key;
    uint64_t                                       next_job_id = 1;

    std::unordered_map<std::string, model::CheckpointRecord> checkpoints;
    std::unordered_map<std::string, model::SnapshotRecord>   snapshots;
    std::vector<model::RecoveryRecord>                       recoveries;

    std::map<std::pair<std::string, uint64_t>, model::StepRecord> steps;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
