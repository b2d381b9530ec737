#include "internal/maintenance/maintenance_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::maintenance {

MaintenanceWorker::MaintenanceWorker(std::shared_ptr<claim::ClaimStore> claims, std::shared_ptr<checkpoint::CheckpointStore> checkpoints,
                                     MaintenanceOptions options)
    : claims_(std::move(claims)), checkpoints_(std::move(checkpoints)), options_(options) {
  if (!claims_ || !checkpoints_) throw util::InvalidArgument("MaintenanceWorker requires a claim store and a checkpoint store");
  if (options_.interval.count() <= 0) options_.interval = std::chrono::seconds(300);
}

MaintenanceWorker::~MaintenanceWorker() {
  Stop();
}

void MaintenanceWorker::Start() {
  if (thread_.joinable()) return;
  stop_   = std::make_shared<util::StopToken>();
  thread_ = std::thread(&MaintenanceWorker::Loop, this);
}

void MaintenanceWorker::Stop() {
  if (stop_) stop_->RequestStop();
  if (thread_.joinable()) thread_.join();
}

SweepResult MaintenanceWorker::RunOnce() {
  SweepResult result;
  result.timed_out   = claims_->CleanupStale(options_.stale_after);
  result.jobs_purged = claims_->PurgeTerminal(options_.job_retention);

  auto cleaned               = checkpoints_->CleanupOlderThan(options_.checkpoint_retention);
  result.checkpoints_deleted = cleaned.checkpoints_deleted;
  result.snapshots_deleted   = cleaned.snapshots_deleted;

  JOBGUARD_LOG_INFO("Maintenance sweep finished", {observability::IntField("timed_out", static_cast<int64_t>(result.timed_out)),
                                                   observability::IntField("jobs_purged", static_cast<int64_t>(result.jobs_purged)),
                                                   observability::IntField("checkpoints_deleted", static_cast<int64_t>(result.checkpoints_deleted)),
                                                   observability::IntField("snapshots_deleted", static_cast<int64_t>(result.snapshots_deleted))});
  return result;
}

void MaintenanceWorker::Loop() {
  while (stop_->WaitFor(options_.interval)) {
    try {
      RunOnce();
    } catch (const std::exception& e) {
      JOBGUARD_LOG_ERROR("Maintenance sweep failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace jobguard::maintenance
