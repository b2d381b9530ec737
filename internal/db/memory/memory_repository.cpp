#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace jobguard::db::memory {

namespace {

template <typename Record>
void SortByCreated(std::vector<Record>& records) {
  std::stable_sort(records.begin(), records.end(), [](const Record& a, const Record& b) { return a.created_at_ms < b.created_at_ms; });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------
// Jobs
// ---------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.job_by_key.contains(r.idempotency_key)) return Result::Err(ErrorCode::AlreadyExists, r.idempotency_key);
  r.id                         = s.next_job_id++;
  s.jobs[r.id]                 = r;
  s.job_by_key[r.idempotency_key] = r.id;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::optional<model::JobRecord> MemoryRepository::GetJobByKey(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.job_by_key.find(key);
  if (it == s.job_by_key.end()) return std::nullopt;
  return s.jobs.at(it->second);
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.idempotency_key != r.idempotency_key) return Result::Err(ErrorCode::ConstraintViolation, "idempotency key is immutable");
  it->second = r;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListStaleJobs(Transaction& t, uint64_t claimed_before_ms) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> out;
  for (const auto& [_, job] : s.jobs) {
    if (jobguard::model::IsActive(job.status) && job.claimed_at_ms < claimed_before_ms) out.push_back(job);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

Result MemoryRepository::DeleteTerminalJobs(Transaction& t, uint64_t updated_before_ms, uint64_t& deleted) {
  auto& s = TX(t).Mutable();
  deleted = 0;
  for (auto it = s.jobs.begin(); it != s.jobs.end();) {
    if (jobguard::model::IsTerminal(it->second.status) && it->second.updated_at_ms < updated_before_ms) {
      s.job_by_key.erase(it->second.idempotency_key);
      it = s.jobs.erase(it);
      ++deleted;
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Checkpoints
// ---------------------------------------------------------------------

Result MemoryRepository::InsertCheckpoint(Transaction& t, const model::CheckpointRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.checkpoints.contains(r.checkpoint_id)) return Result::Err(ErrorCode::AlreadyExists, r.checkpoint_id);
  s.checkpoints[r.checkpoint_id] = r;
  return Result::Ok();
}

std::optional<model::CheckpointRecord> MemoryRepository::GetCheckpoint(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.checkpoints.find(id);
  if (it == s.checkpoints.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpoints(Transaction& t, const std::string& session_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::CheckpointRecord> out;
  for (const auto& [_, record] : s.checkpoints) {
    if (record.session_id == session_id) out.push_back(record);
  }
  SortByCreated(out);
  return out;
}

std::vector<model::CheckpointRecord> MemoryRepository::ListCheckpointsBefore(Transaction& t, uint64_t created_before_ms) {
  const auto&                          s = TX(t).View();
  std::vector<model::CheckpointRecord> out;
  for (const auto& [_, record] : s.checkpoints) {
    if (record.created_at_ms < created_before_ms) out.push_back(record);
  }
  SortByCreated(out);
  return out;
}

Result MemoryRepository::DeleteCheckpoint(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().checkpoints.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Snapshots
// ---------------------------------------------------------------------

Result MemoryRepository::InsertSnapshot(Transaction& t, const model::SnapshotRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.snapshots.contains(r.snapshot_id)) return Result::Err(ErrorCode::AlreadyExists, r.snapshot_id);
  s.snapshots[r.snapshot_id] = r;
  return Result::Ok();
}

std::optional<model::SnapshotRecord> MemoryRepository::GetSnapshot(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.snapshots.find(id);
  if (it == s.snapshots.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshots(Transaction& t, const std::string& session_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::SnapshotRecord> out;
  for (const auto& [_, record] : s.snapshots) {
    if (record.session_id == session_id) out.push_back(record);
  }
  SortByCreated(out);
  return out;
}

std::vector<model::SnapshotRecord> MemoryRepository::ListSnapshotsBefore(Transaction& t, uint64_t created_before_ms) {
  const auto&                        s = TX(t).View();
  std::vector<model::SnapshotRecord> out;
  for (const auto& [_, record] : s.snapshots) {
    if (record.created_at_ms < created_before_ms) out.push_back(record);
  }
  SortByCreated(out);
  return out;
}

Result MemoryRepository::DeleteSnapshot(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().snapshots.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ---------------------------------------------------------------------
// Recovery audit
// ---------------------------------------------------------------------

Result MemoryRepository::InsertRecovery(Transaction& t, const model::RecoveryRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& existing : s.recoveries) {
    if (existing.recovery_id == r.recovery_id) return Result::Err(ErrorCode::AlreadyExists, r.recovery_id);
  }
  s.recoveries.push_back(r);
  return Result::Ok();
}

std::vector<model::RecoveryRecord> MemoryRepository::ListRecoveries(Transaction& t, const std::string& session_id) {
  const auto&                        s = TX(t).View();
  std::vector<model::RecoveryRecord> out;
  for (const auto& record : s.recoveries) {
    if (record.session_id == session_id) out.push_back(record);
  }
  SortByCreated(out);
  return out;
}

// ---------------------------------------------------------------------
// Steps
// ---------------------------------------------------------------------

Result MemoryRepository::AppendStep(Transaction& t, const model::StepRecord& r) {
  auto& s   = TX(t).Mutable();
  auto  key = std::make_pair(r.session_id, r.step_number);
  if (s.steps.contains(key)) return Result::Err(ErrorCode::AlreadyExists, r.session_id + "#" + std::to_string(r.step_number));
  s.steps.emplace(std::move(key), r);
  return Result::Ok();
}

std::vector<model::StepRecord> MemoryRepository::ListSteps(Transaction& t, const std::string& session_id) {
  const auto&                    s = TX(t).View();
  std::vector<model::StepRecord> out;
  // std::map keeps (session, step) ordered, so the range is already ascending.
  for (auto it = s.steps.lower_bound({session_id, 0}); it != s.steps.end() && it->first.first == session_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

uint64_t MemoryRepository::MaxStepNumber(Transaction& t, const std::string& session_id) {
  const auto& s       = TX(t).View();
  uint64_t    max_num = 0;
  for (auto it = s.steps.lower_bound({session_id, 0}); it != s.steps.end() && it->first.first == session_id; ++it) {
    max_num = std::max(max_num, it->first.second);
  }
  return max_num;
}

} // namespace jobguard::db::memory
