#include "internal/checkpoint/checkpoint_store.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_codec.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace jobguard::checkpoint {

using db::model::CheckpointRecord;
using db::model::SnapshotRecord;
using state::EncodedState;
using state::StateCodec;
using util::IntegrityError;

namespace {

void CheckWrite(const db::Result& result, const char* what) {
  db::ThrowIfConflict(result);
  if (!result) {
    throw std::runtime_error(std::string(what) + ": " + result.message);
  }
}

template <typename Record>
EncodedState StoredForm(const Record& record) {
  EncodedState stored;
  stored.checksum       = record.checksum;
  stored.raw_size_bytes = record.raw_size_bytes;
  stored.compression    = record.compression;
  return stored;
}

std::string_view KindName(IntegrityError::Kind kind) {
  switch (kind) {
    case IntegrityError::Kind::kMissing:
      return "missing";
    case IntegrityError::Kind::kSizeMismatch:
      return "size_mismatch";
    case IntegrityError::Kind::kChecksumMismatch:
      return "checksum_mismatch";
    case IntegrityError::Kind::kUndecodable:
      return "undecodable";
  }
  return "unknown";
}

/*
  Reads the payload file and checks it against its row: size, then
  checksum (inside the codec), then decode.
*/
template <typename Message, typename Record, typename Decode>
Message LoadVerified(CheckpointFiles& files, const Record& record, const std::string& id, std::string_view extension, Decode decode) {
  const auto                 path = files.PathFor(id, extension);
  std::optional<std::string> bytes;
  try {
    bytes = files.Read(path);
  } catch (const util::StorageError& e) {
    throw IntegrityError(IntegrityError::Kind::kMissing, "payload file unreadable for " + id + ": " + e.what());
  }
  if (!bytes) {
    throw IntegrityError(IntegrityError::Kind::kMissing, "payload file missing for " + id);
  }
  if (bytes->size() != record.data_size_bytes) {
    throw IntegrityError(IntegrityError::Kind::kSizeMismatch, "payload size " + std::to_string(bytes->size()) + " differs from recorded " +
                                                                  std::to_string(record.data_size_bytes) + " for " + id);
  }
  return decode(*bytes, StoredForm(record));
}

IntegrityReport ReportFor(const std::string& id, const IntegrityError& e) {
  IntegrityReport report;
  report.id              = id;
  report.valid           = false;
  report.integrity_score = IntegrityScore(e.kind());
  report.reason          = e.what();
  report.kind            = e.kind();
  return report;
}

} // namespace

double IntegrityScore(IntegrityError::Kind kind) {
  switch (kind) {
    case IntegrityError::Kind::kMissing:
      return 0.0;
    case IntegrityError::Kind::kSizeMismatch:
      return 0.3;
    case IntegrityError::Kind::kChecksumMismatch:
      return 0.1;
    case IntegrityError::Kind::kUndecodable:
      return 0.5;
  }
  return 0.0;
}

CheckpointStore::CheckpointStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<CheckpointFiles> files, CheckpointStoreOptions options,
                                 util::NowFn now)
    : repository_(std::move(repository)), files_(std::move(files)), options_(options), now_(std::move(now)) {
  if (!repository_ || !files_) throw util::InvalidArgument("CheckpointStore requires a repository and a file store");
  if (!now_) now_ = util::Now;
  if (options_.max_per_session == 0) options_.max_per_session = 50;
}

// ---------------------------------------------------------------------
// Checkpoints
// ---------------------------------------------------------------------

core::v1::Checkpoint CheckpointStore::Save(core::v1::Checkpoint checkpoint) {
  if (checkpoint.session_id().empty()) throw util::InvalidArgument("checkpoint session_id must not be empty");
  if (checkpoint.current_step() < 0 || checkpoint.total_steps() < 0) throw util::InvalidArgument("checkpoint step counters must not be negative");

  observability::SpanScope span("CheckpointStore.Save");
  span.SetAttribute("jobguard.session_id", checkpoint.session_id());

  // Stored size / checksum describe the file, they are not part of it.
  checkpoint.clear_compression_type();
  checkpoint.clear_data_size_bytes();
  checkpoint.clear_checksum();

  auto stored = db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->ListCheckpoints(*tx, checkpoint.session_id());

    auto created_ms = util::ToUnixMillis(now_());
    if (!existing.empty()) {
      const auto& last = existing.back();
      if (checkpoint.current_step() < last.current_step) {
        throw util::InvalidArgument("checkpoint current_step " + std::to_string(checkpoint.current_step()) + " is behind " +
                                    std::to_string(last.current_step) + " for session " + checkpoint.session_id());
      }
      created_ms = std::max(created_ms, last.created_at_ms + 1);
    }

    core::v1::Checkpoint candidate = checkpoint;
    candidate.set_checkpoint_id(util::PrefixedId("chk_"));
    *candidate.mutable_created_at() = util::MillisToProto(created_ms);

    auto encoded = StateCodec::Encode(candidate, options_.compression);

    CheckpointRecord record;
    record.checkpoint_id   = candidate.checkpoint_id();
    record.session_id      = candidate.session_id();
    record.automation_type = candidate.automation_type();
    record.current_step    = candidate.current_step();
    record.total_steps     = candidate.total_steps();
    record.compression     = encoded.compression;
    record.data_size_bytes = encoded.bytes.size();
    record.raw_size_bytes  = encoded.raw_size_bytes;
    record.checksum        = encoded.checksum;
    record.created_at_ms   = created_ms;

    const auto path = files_->PathFor(record.checkpoint_id, kCheckpointExtension);
    files_->WriteNew(path, encoded.bytes);
    try {
      CheckWrite(repository_->InsertCheckpoint(*tx, record), "insert checkpoint");
      tx->Commit();
    } catch (...) {
      files_->Remove(path);
      throw;
    }

    candidate.set_compression_type(record.compression);
    candidate.set_data_size_bytes(record.data_size_bytes);
    candidate.set_checksum(record.checksum);
    return candidate;
  });

  observability::Metrics::Instance().ObserveCheckpointBytes("checkpoint", stored.data_size_bytes());
  JOBGUARD_LOG_INFO("checkpoint saved",
                    {observability::StringField("checkpoint_id", stored.checkpoint_id()), observability::StringField("session_id", stored.session_id()),
                     observability::IntField("current_step", stored.current_step()), observability::IntField("total_steps", stored.total_steps()),
                     observability::IntField("bytes", static_cast<int64_t>(stored.data_size_bytes())),
                     observability::StringField("compression", StateCodec::CompressionName(stored.compression_type()))});

  PruneSession(stored.session_id());
  return stored;
}

core::v1::Checkpoint CheckpointStore::Load(const std::string& checkpoint_id) {
  auto record = GetCheckpointRecord(checkpoint_id);
  if (!record) throw util::NotFound("checkpoint not found: " + checkpoint_id);

  try {
    auto checkpoint = LoadVerified<core::v1::Checkpoint>(*files_, *record, checkpoint_id, kCheckpointExtension, StateCodec::DecodeCheckpoint);
    if (checkpoint.checkpoint_id() != checkpoint_id || checkpoint.session_id() != record->session_id) {
      throw IntegrityError(IntegrityError::Kind::kUndecodable, "payload identity does not match metadata for " + checkpoint_id);
    }
    checkpoint.set_compression_type(record->compression);
    checkpoint.set_data_size_bytes(record->data_size_bytes);
    checkpoint.set_checksum(record->checksum);
    return checkpoint;
  } catch (const IntegrityError& e) {
    JOBGUARD_LOG_WARN("checkpoint integrity failure", {observability::StringField("checkpoint_id", checkpoint_id),
                                                       observability::StringField("kind", KindName(e.kind())), observability::StringField("error", e.what())});
    throw;
  }
}

IntegrityReport CheckpointStore::ValidateIntegrity(const std::string& checkpoint_id) {
  IntegrityReport report;
  report.id = checkpoint_id;

  if (!GetCheckpointRecord(checkpoint_id)) {
    report.reason = "checkpoint metadata not found";
    report.kind   = IntegrityError::Kind::kMissing;
    return report;
  }

  try {
    Load(checkpoint_id);
  } catch (const IntegrityError& e) {
    return ReportFor(checkpoint_id, e);
  }

  report.valid           = true;
  report.integrity_score = 1.0;
  report.reason          = "ok";
  return report;
}

std::optional<CheckpointRecord> CheckpointStore::GetCheckpointRecord(const std::string& checkpoint_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetCheckpoint(*tx, checkpoint_id);
  tx->Commit();
  return record;
}

std::vector<CheckpointRecord> CheckpointStore::ListCheckpoints(const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListCheckpoints(*tx, session_id);
  tx->Commit();
  return records;
}

std::optional<CheckpointRecord> CheckpointStore::LatestCheckpoint(const std::string& session_id) {
  auto records = ListCheckpoints(session_id);
  if (records.empty()) return std::nullopt;
  return records.back();
}

void CheckpointStore::PruneSession(const std::string& session_id) {
  auto records = ListCheckpoints(session_id);
  if (records.size() <= options_.max_per_session) return;

  const auto excess = records.size() - options_.max_per_session;
  for (std::size_t i = 0; i < excess; ++i) {
    DeleteCheckpoint(records[i]);
  }
  JOBGUARD_LOG_DEBUG("checkpoints pruned", {observability::StringField("session_id", session_id), observability::IntField("count", static_cast<int64_t>(excess))});
}

bool CheckpointStore::DeleteCheckpoint(const CheckpointRecord& record) {
  if (!files_->Remove(files_->PathFor(record.checkpoint_id, kCheckpointExtension))) {
    return false;
  }

  return db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteCheckpoint(*tx, record.checkpoint_id);
    db::ThrowIfConflict(result);
    if (!result && result.code != db::ErrorCode::NotFound) {
      JOBGUARD_LOG_WARN("checkpoint row delete failed",
                        {observability::StringField("checkpoint_id", record.checkpoint_id), observability::StringField("error", result.message)});
      return false;
    }
    tx->Commit();
    return true;
  });
}

// ---------------------------------------------------------------------
// Session snapshots
// ---------------------------------------------------------------------

core::v1::SessionSnapshot CheckpointStore::SaveSnapshot(core::v1::SessionSnapshot snapshot) {
  if (snapshot.session_id().empty()) throw util::InvalidArgument("snapshot session_id must not be empty");

  observability::SpanScope span("CheckpointStore.SaveSnapshot");
  span.SetAttribute("jobguard.session_id", snapshot.session_id());

  snapshot.clear_compression_type();
  snapshot.clear_data_size_bytes();
  snapshot.clear_checksum();

  auto stored = db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx       = repository_->Begin();
    auto existing = repository_->ListSnapshots(*tx, snapshot.session_id());

    auto created_ms = util::ToUnixMillis(now_());
    if (!existing.empty()) {
      created_ms = std::max(created_ms, existing.back().created_at_ms + 1);
    }

    core::v1::SessionSnapshot candidate = snapshot;
    candidate.set_snapshot_id(util::PrefixedId("snap_"));
    *candidate.mutable_created_at() = util::MillisToProto(created_ms);

    auto encoded = StateCodec::Encode(candidate, options_.compression);

    SnapshotRecord record;
    record.snapshot_id     = candidate.snapshot_id();
    record.session_id      = candidate.session_id();
    record.current_step    = state::GetInt(candidate.automation_state(), "current_step");
    record.total_steps     = state::GetInt(candidate.automation_state(), "total_steps");
    record.compression     = encoded.compression;
    record.data_size_bytes = encoded.bytes.size();
    record.raw_size_bytes  = encoded.raw_size_bytes;
    record.checksum        = encoded.checksum;
    record.created_at_ms   = created_ms;

    const auto path = files_->PathFor(record.snapshot_id, kSnapshotExtension);
    files_->WriteNew(path, encoded.bytes);
    try {
      CheckWrite(repository_->InsertSnapshot(*tx, record), "insert snapshot");
      tx->Commit();
    } catch (...) {
      files_->Remove(path);
      throw;
    }

    candidate.set_compression_type(record.compression);
    candidate.set_data_size_bytes(record.data_size_bytes);
    candidate.set_checksum(record.checksum);
    return candidate;
  });

  observability::Metrics::Instance().ObserveCheckpointBytes("snapshot", stored.data_size_bytes());
  JOBGUARD_LOG_INFO("session snapshot saved", {observability::StringField("snapshot_id", stored.snapshot_id()),
                                               observability::StringField("session_id", stored.session_id()),
                                               observability::IntField("bytes", static_cast<int64_t>(stored.data_size_bytes()))});
  return stored;
}

core::v1::SessionSnapshot CheckpointStore::LoadSnapshot(const std::string& snapshot_id) {
  auto record = GetSnapshotRecord(snapshot_id);
  if (!record) throw util::NotFound("snapshot not found: " + snapshot_id);

  try {
    auto snapshot = LoadVerified<core::v1::SessionSnapshot>(*files_, *record, snapshot_id, kSnapshotExtension, StateCodec::DecodeSnapshot);
    if (snapshot.snapshot_id() != snapshot_id || snapshot.session_id() != record->session_id) {
      throw IntegrityError(IntegrityError::Kind::kUndecodable, "payload identity does not match metadata for " + snapshot_id);
    }
    snapshot.set_compression_type(record->compression);
    snapshot.set_data_size_bytes(record->data_size_bytes);
    snapshot.set_checksum(record->checksum);
    return snapshot;
  } catch (const IntegrityError& e) {
    JOBGUARD_LOG_WARN("snapshot integrity failure", {observability::StringField("snapshot_id", snapshot_id),
                                                     observability::StringField("kind", KindName(e.kind())), observability::StringField("error", e.what())});
    throw;
  }
}

IntegrityReport CheckpointStore::ValidateSnapshotIntegrity(const std::string& snapshot_id) {
  IntegrityReport report;
  report.id = snapshot_id;

  if (!GetSnapshotRecord(snapshot_id)) {
    report.reason = "snapshot metadata not found";
    report.kind   = IntegrityError::Kind::kMissing;
    return report;
  }

  try {
    LoadSnapshot(snapshot_id);
  } catch (const IntegrityError& e) {
    return ReportFor(snapshot_id, e);
  }

  report.valid           = true;
  report.integrity_score = 1.0;
  report.reason          = "ok";
  return report;
}

std::optional<SnapshotRecord> CheckpointStore::GetSnapshotRecord(const std::string& snapshot_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSnapshot(*tx, snapshot_id);
  tx->Commit();
  return record;
}

std::vector<SnapshotRecord> CheckpointStore::ListSnapshots(const std::string& session_id) {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSnapshots(*tx, session_id);
  tx->Commit();
  return records;
}

bool CheckpointStore::DeleteSnapshot(const SnapshotRecord& record) {
  if (!files_->Remove(files_->PathFor(record.snapshot_id, kSnapshotExtension))) {
    return false;
  }

  return db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx     = repository_->Begin();
    auto result = repository_->DeleteSnapshot(*tx, record.snapshot_id);
    db::ThrowIfConflict(result);
    if (!result && result.code != db::ErrorCode::NotFound) {
      JOBGUARD_LOG_WARN("snapshot row delete failed",
                        {observability::StringField("snapshot_id", record.snapshot_id), observability::StringField("error", result.message)});
      return false;
    }
    tx->Commit();
    return true;
  });
}

// ---------------------------------------------------------------------
// Retention
// ---------------------------------------------------------------------

CleanupResult CheckpointStore::CleanupOlderThan(std::chrono::hours retention) {
  const auto cutoff = util::ToUnixMillis(now_() - retention);

  std::vector<CheckpointRecord> checkpoints;
  std::vector<SnapshotRecord>   snapshots;
  {
    auto tx     = repository_->Begin();
    checkpoints = repository_->ListCheckpointsBefore(*tx, cutoff);
    snapshots   = repository_->ListSnapshotsBefore(*tx, cutoff);
    tx->Commit();
  }

  CleanupResult result;
  for (const auto& record : checkpoints) {
    if (DeleteCheckpoint(record)) ++result.checkpoints_deleted;
  }
  for (const auto& record : snapshots) {
    if (DeleteSnapshot(record)) ++result.snapshots_deleted;
  }

  if (result.checkpoints_deleted + result.snapshots_deleted > 0) {
    JOBGUARD_LOG_INFO("expired checkpoints removed", {observability::IntField("checkpoints", static_cast<int64_t>(result.checkpoints_deleted)),
                                                      observability::IntField("snapshots", static_cast<int64_t>(result.snapshots_deleted))});
  }
  return result;
}

} // namespace jobguard::checkpoint
