#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace jobguard::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
