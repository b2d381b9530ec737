#include "internal/persistence/persistence_coordinator.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using jobguard::checkpoint::CheckpointFiles;
using jobguard::checkpoint::CheckpointStore;
using jobguard::core::v1::Checkpoint;
using jobguard::core::v1::SessionSnapshot;
using jobguard::persistence::PersistenceCoordinator;
using jobguard::recovery::RecoveryPlan;
using jobguard::recovery::RecoveryStatus;

namespace st = jobguard::state;

struct Fixture {
  explicit Fixture(const std::string& test_name)
      : dir(std::filesystem::temp_directory_path() / "jobguard_persistence_tests" / (test_name + "_" + jobguard::util::PrefixedId(""))),
        repo(std::make_shared<jobguard::db::memory::MemoryRepository>()),
        store(std::make_shared<CheckpointStore>(repo, std::make_shared<CheckpointFiles>(dir.string(), false))),
        coordinator(store, std::make_shared<jobguard::recovery::RecoveryPlanner>(store),
                    std::make_shared<jobguard::recovery::RecoveryExecutor>(store, repo), jobguard::persistence::PersistenceOptions{std::chrono::seconds(1)}) {
  }

  std::filesystem::path                                    dir;
  std::shared_ptr<jobguard::db::memory::MemoryRepository> repo;
  std::shared_ptr<CheckpointStore>                         store;
  PersistenceCoordinator                                   coordinator;
};

Checkpoint Progress(const std::string& session_id, int64_t step) {
  Checkpoint checkpoint;
  checkpoint.set_session_id(session_id);
  checkpoint.set_automation_type("invoice_portal");
  checkpoint.set_current_step(step);
  checkpoint.set_total_steps(10);
  *checkpoint.mutable_state_data()        = st::MapOf({{"page", st::MakeString("step-" + std::to_string(step))}});
  *checkpoint.mutable_execution_context() = st::MapOf({{"url", st::MakeString("https://portal.example")}});
  return checkpoint;
}

void TestCreateCheckpointAndSnapshot() {
  Fixture fx("create");

  const auto saved = fx.coordinator.CreateCheckpoint(Progress("session-c", 3));
  assert(!saved.checkpoint_id().empty());
  assert(saved.data_size_bytes() > 0);

  SessionSnapshot snapshot;
  snapshot.set_session_id("session-c");
  *snapshot.mutable_automation_state() = st::MapOf({{"current_step", st::MakeInt(4)}, {"total_steps", st::MakeInt(10)}});
  const auto snap = fx.coordinator.CreateSnapshot(snapshot);
  assert(!snap.snapshot_id().empty());

  assert(fx.store->ListCheckpoints("session-c").size() == 1);
  assert(fx.store->ListSnapshots("session-c").size() == 1);
}

void TestAutoCheckpointLoopSavesUntilStopped() {
  Fixture              fx("auto");
  std::atomic<int64_t> step{0};

  fx.coordinator.StartSessionPersistence("session-auto", "invoice_portal", [&]() -> std::optional<Checkpoint> {
    Checkpoint checkpoint;
    checkpoint.set_current_step(++step);
    checkpoint.set_total_steps(10);
    *checkpoint.mutable_state_data() = st::MapOf({{"tick", st::MakeInt(step.load())}});
    return checkpoint;
  });
  assert(fx.coordinator.IsPersisting("session-auto"));

  bool rejected = false;
  try {
    fx.coordinator.StartSessionPersistence("session-auto", "invoice_portal", [] { return std::optional<Checkpoint>{}; });
  } catch (const jobguard::util::AlreadyExists&) {
    rejected = true;
  }
  assert(rejected);

  std::this_thread::sleep_for(std::chrono::milliseconds(2500));
  assert(fx.coordinator.StopSessionPersistence("session-auto"));
  assert(!fx.coordinator.IsPersisting("session-auto"));
  assert(!fx.coordinator.StopSessionPersistence("session-auto"));

  const auto saved = fx.store->ListCheckpoints("session-auto");
  assert(saved.size() >= 1);
  assert(saved.size() == static_cast<size_t>(step.load()));

  const auto latest = fx.store->Load(saved.back().id);
  assert(latest.session_id() == "session-auto");
  assert(latest.automation_type() == "invoice_portal");

  // Nothing is written after the loop stopped.
  std::this_thread::sleep_for(std::chrono::milliseconds(1200));
  assert(fx.store->ListCheckpoints("session-auto").size() == saved.size());
}

void TestSkippedTicksWriteNothing() {
  Fixture fx("skip");
  fx.coordinator.StartSessionPersistence("session-idle", "invoice_portal", [] { return std::optional<Checkpoint>{}; });
  std::this_thread::sleep_for(std::chrono::milliseconds(1300));
  fx.coordinator.StopAll();
  assert(!fx.coordinator.IsPersisting("session-idle"));
  assert(fx.store->ListCheckpoints("session-idle").empty());
}

void TestRecoverSessionRestoresLatestCheckpoint() {
  Fixture fx("recover");
  fx.coordinator.CreateCheckpoint(Progress("session-r", 2));
  const auto latest = fx.coordinator.CreateCheckpoint(Progress("session-r", 5));

  const auto result = fx.coordinator.RecoverSession("session-r");
  assert(result.success);
  assert(result.target_id == latest.checkpoint_id());
  assert(result.state.has_value());
  assert(result.state->current_step == 5);

  const auto missing = fx.coordinator.RecoverSession("session-none");
  assert(!missing.success);
  assert(!missing.error.empty());
}

void TestRecoveryInfoCarriesRecommendation() {
  Fixture fx("info");
  fx.coordinator.CreateCheckpoint(Progress("session-i", 1));
  fx.coordinator.CreateCheckpoint(Progress("session-i", 2));

  const auto info = fx.coordinator.GetSessionRecoveryInfo("session-i");
  assert(info.session_id == "session-i");
  assert(info.recovery_points.size() == 2);
  assert(info.plan.status == RecoveryStatus::kRecoverable);
  assert(info.recommendation.action == "immediate_recovery");

  const auto empty = fx.coordinator.GetSessionRecoveryInfo("session-empty");
  assert(empty.recovery_points.empty());
  assert(empty.recommendation.action == "manual_intervention");
  assert(empty.recommendation.confidence == 0.0);
}

void TestRecommendThresholds() {
  RecoveryPlan plan;
  plan.status     = RecoveryStatus::kRecoverable;
  plan.confidence = 0.95;
  assert(PersistenceCoordinator::Recommend(plan).action == "immediate_recovery");

  plan.confidence = 0.75;
  assert(PersistenceCoordinator::Recommend(plan).action == "recovery_with_validation");

  plan.confidence = 0.5;
  assert(PersistenceCoordinator::Recommend(plan).action == "manual_intervention");

  plan.status     = RecoveryStatus::kPartial;
  plan.confidence = 0.9;
  const auto partial = PersistenceCoordinator::Recommend(plan);
  assert(partial.action == "recovery_with_validation");
  assert(partial.confidence == 0.7);

  plan.status     = RecoveryStatus::kCorrupted;
  plan.confidence = 0.95;
  assert(PersistenceCoordinator::Recommend(plan).action == "manual_intervention");
}

} // namespace

int main() {
  TestCreateCheckpointAndSnapshot();
  TestAutoCheckpointLoopSavesUntilStopped();
  TestSkippedTicksWriteNothing();
  TestRecoverSessionRestoresLatestCheckpoint();
  TestRecoveryInfoCarriesRecommendation();
  TestRecommendThresholds();
  std::cout << "jobguard_unit_persistence_coordinator: pass\n";
  return 0;
}
