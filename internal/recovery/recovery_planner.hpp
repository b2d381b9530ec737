#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/recovery/recovery_types.hpp"
#include "internal/util/time.hpp"

namespace jobguard::recovery {

struct RecoveryPlannerOptions {
  uint32_t max_recovery_options = 5;

  // Points older than this are EXPIRED. Zero disables the age limit.
  uint32_t max_recovery_age_days = 0;
};

/*
  RecoveryPlanner

  Scores the checkpoints and snapshots of a session and picks the most
  trustworthy one. Planning is read only: it validates payload files
  but never repairs or deletes them.
*/
class RecoveryPlanner {
 public:
  explicit RecoveryPlanner(std::shared_ptr<checkpoint::CheckpointStore> store, RecoveryPlannerOptions options = {}, util::NowFn now = util::Now);

  // Checkpoints and snapshots of the session, newest first.
  std::vector<RecoveryPoint> ListRecoveryPoints(const std::string& session_id);

  /*
    Without a target the first point in (confidence, recency) order that
    passes integrity validation is chosen. An explicit target is
    evaluated on its own and never silently replaced.
  */
  RecoveryPlan Plan(const std::string& session_id, const std::optional<std::string>& target_id = std::nullopt);

 private:
  struct Evaluation {
    RecoveryStatus status          = RecoveryStatus::kMissing;
    double         integrity_score = 0.0;
    std::string    reason;
  };

  Evaluation Evaluate(const RecoveryPoint& point);

  std::shared_ptr<checkpoint::CheckpointStore> store_;
  RecoveryPlannerOptions                       options_;
  util::NowFn                                  now_;
};

std::string_view StrategyFor(const RecoveryPoint& point);

uint32_t EstimateRecoverySeconds(std::string_view strategy, uint64_t data_size_bytes);

} // namespace jobguard::recovery
