#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/job_status.hpp"

namespace jobguard::db::model {

/*
  Persistent job ledger row.

  IMPORTANT:
  - idempotency_key is unique; the row is the only authority on which
    worker owns the key.
  - result holds StateCodec::SerializeValue bytes.
*/
struct JobRecord {
  uint64_t    id = 0;
  std::string idempotency_key;
  int64_t     ticket_id = 0;
  std::string operation_type;

  jobguard::model::JobStatus status = jobguard::model::JobStatus::kPending;

  std::string claimed_by;
  uint64_t    claimed_at_ms = 0;

  std::optional<uint64_t>    completed_at_ms;
  std::optional<std::string> result;
  std::string                error_message;

  uint32_t retry_count   = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace jobguard::db::model
