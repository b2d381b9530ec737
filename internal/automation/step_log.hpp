#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace jobguard::automation {

struct StepSummary {
  uint64_t attempts      = 0;
  uint64_t successes     = 0;
  double   success_rate  = 0.0;
  uint64_t total_time_ms = 0;
};

// Locate entries (no usable candidate, escalation markers) are not attempts.
StepSummary Summarize(const std::vector<db::model::StepRecord>& steps);

/*
  StepLog

  Append-only history of one automation session, persisted row by row.
  Numbering continues after the highest step already stored for the
  session, so a resumed session never reuses a step number.
*/
class StepLog {
 public:
  StepLog(std::shared_ptr<db::Repository> repository, std::string session_id, util::NowFn now = util::Now);

  // Assigns step_number and created_at, then persists. Returns the stored step.
  db::model::StepRecord Append(db::model::StepRecord step);

  // Steps appended through this instance, in order.
  const std::vector<db::model::StepRecord>& Steps() const {
    return steps_;
  }

  StepSummary Summary() const {
    return Summarize(steps_);
  }

  const std::string& session_id() const {
    return session_id_;
  }

 private:
  std::shared_ptr<db::Repository>    repository_;
  std::string                        session_id_;
  util::NowFn                        now_;
  uint64_t                           next_step_ = 1;
  std::vector<db::model::StepRecord> steps_;
};

} // namespace jobguard::automation
