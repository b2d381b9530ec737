#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkpoint/checkpoint_files.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "jobguard/core/v1/checkpoint.pb.h"

namespace jobguard::checkpoint {

inline constexpr std::string_view kCheckpointExtension = ".chk";
inline constexpr std::string_view kSnapshotExtension   = ".snap";

// Result of a non-destructive integrity check.
struct IntegrityReport {
  std::string id;
  bool        valid           = false;
  double      integrity_score = 0.0;
  std::string reason;

  std::optional<util::IntegrityError::Kind> kind;
};

double IntegrityScore(util::IntegrityError::Kind kind);

struct CheckpointStoreOptions {
  core::v1::CompressionType compression     = core::v1::COMPRESSION_TYPE_GZIP;
  uint32_t                  max_per_session = 50;
  int                       max_conflict_attempts = 8;
};

struct CleanupResult {
  uint64_t checkpoints_deleted = 0;
  uint64_t snapshots_deleted   = 0;
};

/*
  CheckpointStore

  Payload bytes live in write-once files; size, checksum and step
  counters live in a metadata row. The file is complete before the row
  is committed, so a committed row never points at a partial file.

  Within a session checkpoints are totally ordered: created_at is
  strictly increasing and current_step never decreases.
*/
class CheckpointStore {
 public:
  CheckpointStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<CheckpointFiles> files, CheckpointStoreOptions options = {},
                  util::NowFn now = util::Now);

  /*
    Assigns checkpoint_id and created_at, writes the file and the row,
    then prunes the session beyond max_per_session. Returns the stored
    checkpoint with compression, size and checksum filled in.
  */
  core::v1::Checkpoint Save(core::v1::Checkpoint checkpoint);

  // Throws util::NotFound for unknown ids and util::IntegrityError when
  // the file is missing, resized, tampered with or undecodable.
  core::v1::Checkpoint Load(const std::string& checkpoint_id);

  IntegrityReport ValidateIntegrity(const std::string& checkpoint_id);

  std::optional<db::model::CheckpointRecord> GetCheckpointRecord(const std::string& checkpoint_id);
  std::vector<db::model::CheckpointRecord>   ListCheckpoints(const std::string& session_id);
  std::optional<db::model::CheckpointRecord> LatestCheckpoint(const std::string& session_id);

  core::v1::SessionSnapshot SaveSnapshot(core::v1::SessionSnapshot snapshot);
  core::v1::SessionSnapshot LoadSnapshot(const std::string& snapshot_id);
  IntegrityReport           ValidateSnapshotIntegrity(const std::string& snapshot_id);

  std::optional<db::model::SnapshotRecord> GetSnapshotRecord(const std::string& snapshot_id);
  std::vector<db::model::SnapshotRecord>   ListSnapshots(const std::string& session_id);

  // File first, then row, per checkpoint / snapshot.
  CleanupResult CleanupOlderThan(std::chrono::hours retention);

 private:
  void PruneSession(const std::string& session_id);
  bool DeleteCheckpoint(const db::model::CheckpointRecord& record);
  bool DeleteSnapshot(const db::model::SnapshotRecord& record);

  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<CheckpointFiles> files_;
  CheckpointStoreOptions           options_;
  util::NowFn                      now_;
};

} // namespace jobguard::checkpoint
