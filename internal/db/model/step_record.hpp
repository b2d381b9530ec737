#pragma once

#include <cstdint>
#include <string>

#include "internal/model/step_status.hpp"

namespace jobguard::db::model {

/*
  One automation attempt. (session_id, step_number) is unique and step
  numbers only grow within a session.
*/
struct StepRecord {
  std::string session_id;
  uint64_t    step_number = 0;

  std::string                 route;
  jobguard::model::ActionType action_type = jobguard::model::ActionType::kLocate;
  std::string                 selector;
  jobguard::model::StepStatus result_status = jobguard::model::StepStatus::kFailed;

  uint64_t    timing_ms  = 0;
  bool        retry_used = false;
  std::string reasoning;
  std::string evidence_ref;
  uint64_t    created_at_ms = 0;
};

} // namespace jobguard::db::model
