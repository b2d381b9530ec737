#pragma once

#include <memory>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/recovery/recovery_types.hpp"
#include "internal/util/time.hpp"

namespace jobguard::recovery {

/*
  RecoveryExecutor

  Applies a RecoveryPlan: loads the target through the checkpoint store,
  rebuilds the session state and runs the plan's validation rules. Only
  RECOVERABLE plans are executed; anything else is refused with an error
  in the result. Every call, refused or not, leaves one audit row, so a
  plan executes at most once.
*/
class RecoveryExecutor {
 public:
  RecoveryExecutor(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<db::Repository> repository, util::NowFn now = util::Now);

  RecoveryResult Execute(const RecoveryPlan& plan);

 private:
  RecoveredState Restore(const RecoveryPlan& plan);
  bool           AlreadyExecuted(const RecoveryPlan& plan);
  void           Audit(const RecoveryPlan& plan, const RecoveryResult& result);

  std::shared_ptr<checkpoint::CheckpointStore> store_;
  std::shared_ptr<db::Repository>              repository_;
  util::NowFn                                  now_;
};

} // namespace jobguard::recovery
