#pragma once

#include <chrono>
#include <memory>
#include <thread>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/claim/claim_store.hpp"
#include "internal/util/stop_token.hpp"

namespace jobguard::maintenance {

struct MaintenanceOptions {
  std::chrono::seconds interval{300};
  std::chrono::hours   stale_after{24};
  std::chrono::hours   job_retention{24 * 30};
  std::chrono::hours   checkpoint_retention{24 * 30};
};

struct SweepResult {
  uint64_t timed_out           = 0;
  uint64_t jobs_purged         = 0;
  uint64_t checkpoints_deleted = 0;
  uint64_t snapshots_deleted   = 0;
};

/*
  Periodically sweeps stale claims into TIMEOUT, purges old terminal
  jobs and deletes expired checkpoints / snapshots.
*/
class MaintenanceWorker {
 public:
  MaintenanceWorker(std::shared_ptr<claim::ClaimStore> claims, std::shared_ptr<checkpoint::CheckpointStore> checkpoints, MaintenanceOptions options = {});
  ~MaintenanceWorker();

  void Start();
  void Stop();

  // One sweep on the calling thread.
  SweepResult RunOnce();

 private:
  void Loop();

  std::shared_ptr<claim::ClaimStore>           claims_;
  std::shared_ptr<checkpoint::CheckpointStore> checkpoints_;
  MaintenanceOptions                           options_;

  std::thread                      thread_;
  std::shared_ptr<util::StopToken> stop_;
};

} // namespace jobguard::maintenance
