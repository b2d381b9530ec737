#pragma once

#include <cstdint>
#include <string>

namespace jobguard::db::model {

// Audit row for one executed recovery attempt.
struct RecoveryRecord {
  std::string recovery_id;
  std::string session_id;
  std::string target_id;
  std::string strategy;
  uint8_t     status = 0;

  double   confidence        = 0.0;
  double   integrity_score   = 0.0;
  uint32_t estimated_seconds = 0;

  bool        success = false;
  std::string error;
  uint64_t    recovery_time_ms = 0;
  uint64_t    created_at_ms    = 0;
};

} // namespace jobguard::db::model
