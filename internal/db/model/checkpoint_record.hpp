#pragma once

#include <cstdint>
#include <string>

#include "jobguard/core/v1/checkpoint.pb.h"

namespace jobguard::db::model {

/*
  Metadata row describing one <checkpoint_id>.chk file. The file holds
  the compressed payload; this row is what integrity checks compare to.
*/
struct CheckpointRecord {
  std::string checkpoint_id;
  std::string session_id;
  std::string automation_type;

  int64_t current_step = 0;
  int64_t total_steps  = 0;

  jobguard::core::v1::CompressionType compression = jobguard::core::v1::COMPRESSION_TYPE_NONE;

  uint64_t    data_size_bytes = 0;
  uint64_t    raw_size_bytes  = 0;
  std::string checksum;
  uint64_t    created_at_ms = 0;
};

} // namespace jobguard::db::model
