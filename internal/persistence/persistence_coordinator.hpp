#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/recovery/recovery_executor.hpp"
#include "internal/recovery/recovery_planner.hpp"
#include "internal/util/stop_token.hpp"

namespace jobguard::persistence {

/*
  Supplies the session's current progress to the auto-checkpoint loop.
  session_id and automation_type are filled in by the coordinator.
  Returning nullopt skips the tick.
*/
using ProgressSource = std::function<std::optional<core::v1::Checkpoint>()>;

struct RecoveryRecommendation {
  std::string action;
  double      confidence = 0.0;
  std::string message;
};

struct SessionRecoveryInfo {
  std::string                          session_id;
  std::vector<recovery::RecoveryPoint> recovery_points;
  recovery::RecoveryPlan               plan;
  RecoveryRecommendation               recommendation;
};

struct PersistenceOptions {
  std::chrono::seconds auto_checkpoint_interval{300};
};

/*
  PersistenceCoordinator

  Facade over checkpointing and recovery. Owns one background loop per
  session with auto-checkpointing enabled; each loop sleeps on its own
  StopToken so stopping a session wakes it immediately.
*/
class PersistenceCoordinator {
 public:
  PersistenceCoordinator(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<recovery::RecoveryPlanner> planner,
                         std::shared_ptr<recovery::RecoveryExecutor> executor, PersistenceOptions options = {});
  ~PersistenceCoordinator();

  PersistenceCoordinator(const PersistenceCoordinator&)            = delete;
  PersistenceCoordinator& operator=(const PersistenceCoordinator&) = delete;

  // Throws util::AlreadyExists when the session already persists. A zero
  // interval uses the configured default.
  void StartSessionPersistence(const std::string& session_id, const std::string& automation_type, ProgressSource source,
                               std::chrono::seconds interval = std::chrono::seconds{0});

  // Returns false when the session had no running loop.
  bool StopSessionPersistence(const std::string& session_id);
  void StopAll();
  bool IsPersisting(const std::string& session_id) const;

  core::v1::Checkpoint      CreateCheckpoint(core::v1::Checkpoint checkpoint);
  core::v1::SessionSnapshot CreateSnapshot(core::v1::SessionSnapshot snapshot);

  // Plans and executes in one call. The executor records the audit row.
  recovery::RecoveryResult RecoverSession(const std::string& session_id, const std::optional<std::string>& target_id = std::nullopt);

  SessionRecoveryInfo GetSessionRecoveryInfo(const std::string& session_id);

  static RecoveryRecommendation Recommend(const recovery::RecoveryPlan& plan);

  const std::shared_ptr<checkpoint::CheckpointStore>& store() const {
    return store_;
  }

 private:
  struct SessionLoop {
    std::shared_ptr<util::StopToken> stop;
    std::thread                      thread;
  };

  static void RunLoop(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<util::StopToken> stop, std::string session_id,
                      std::string automation_type, ProgressSource source, std::chrono::seconds interval);

  std::shared_ptr<checkpoint::CheckpointStore> store_;
  std::shared_ptr<recovery::RecoveryPlanner>   planner_;
  std::shared_ptr<recovery::RecoveryExecutor>  executor_;
  PersistenceOptions                           options_;

  mutable std::mutex                 mutex_;
  std::map<std::string, SessionLoop> sessions_;
};

} // namespace jobguard::persistence
