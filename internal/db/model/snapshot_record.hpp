#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "jobguard/core/v1/checkpoint.pb.h"

namespace jobguard::db::model {

struct SnapshotRecord {
  std::string snapshot_id;
  std::string session_id;

  // Copied from automation_state when the snapshot carries them.
  std::optional<int64_t> current_step;
  std::optional<int64_t> total_steps;

  jobguard::core::v1::CompressionType compression = jobguard::core::v1::COMPRESSION_TYPE_NONE;

  uint64_t    data_size_bytes = 0;
  uint64_t    raw_size_bytes  = 0;
  std::string checksum;
  uint64_t    created_at_ms = 0;
};

} // namespace jobguard::db::model
