#include "internal/maintenance/maintenance_worker.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/uuid.hpp"

namespace {

using jobguard::maintenance::MaintenanceOptions;
using jobguard::maintenance::MaintenanceWorker;
using jobguard::model::JobStatus;

namespace st = jobguard::state;

struct ManualClock {
  jobguard::util::TimePoint now = jobguard::util::FromUnixMillis(1700000000000);

  jobguard::util::NowFn Fn() {
    return [this] { return now; };
  }
};

struct Fixture {
  Fixture()
      : dir(std::filesystem::temp_directory_path() / "jobguard_maintenance_tests" / jobguard::util::PrefixedId("run_")),
        repo(std::make_shared<jobguard::db::memory::MemoryRepository>()),
        claims(std::make_shared<jobguard::claim::ClaimStore>(repo, std::make_shared<jobguard::claim::LocalLockTable>(), clock.Fn())),
        checkpoints(std::make_shared<jobguard::checkpoint::CheckpointStore>(repo, std::make_shared<jobguard::checkpoint::CheckpointFiles>(dir.string(), false),
                                                                            jobguard::checkpoint::CheckpointStoreOptions{}, clock.Fn())) {
  }

  ManualClock                                              clock;
  std::filesystem::path                                    dir;
  std::shared_ptr<jobguard::db::memory::MemoryRepository> repo;
  std::shared_ptr<jobguard::claim::ClaimStore>             claims;
  std::shared_ptr<jobguard::checkpoint::CheckpointStore>   checkpoints;
};

void TestSweepTimesOutThenPurges() {
  Fixture           fx;
  MaintenanceWorker worker(fx.claims, fx.checkpoints, MaintenanceOptions{std::chrono::seconds(60), std::chrono::hours(24), std::chrono::hours(24 * 7),
                                                                         std::chrono::hours(24 * 30)});

  const auto key     = jobguard::claim::ComputeIdempotencyKey(42, "invoice_portal", st::MapOf({{"url", st::MakeString("https://x")}}));
  const auto claimed = std::get<jobguard::claim::Claimed>(fx.claims->Claim(key, "worker-a", std::chrono::seconds(300)));

  jobguard::core::v1::Checkpoint checkpoint;
  checkpoint.set_session_id("job-" + std::to_string(claimed.job_id));
  checkpoint.set_current_step(1);
  checkpoint.set_total_steps(3);
  *checkpoint.mutable_state_data() = st::MapOf({{"page", st::MakeString("login")}});
  fx.checkpoints->Save(checkpoint);

  auto first = worker.RunOnce();
  assert(first.timed_out == 0);
  assert(first.jobs_purged == 0);
  assert(first.checkpoints_deleted == 0);

  fx.clock.now += std::chrono::hours(25);
  auto second = worker.RunOnce();
  assert(second.timed_out == 1);
  assert(second.jobs_purged == 0);
  assert(fx.claims->GetJob(claimed.job_id)->status == JobStatus::kTimeout);

  fx.clock.now += std::chrono::hours(24 * 31);
  auto third = worker.RunOnce();
  assert(third.timed_out == 0);
  assert(third.jobs_purged == 1);
  assert(third.checkpoints_deleted == 1);
  assert(!fx.claims->GetJob(claimed.job_id));
}

void TestStartStopIsIdempotent() {
  Fixture           fx;
  MaintenanceWorker worker(fx.claims, fx.checkpoints);
  worker.Start();
  worker.Start();
  worker.Stop();
  worker.Stop();
}

} // namespace

int main() {
  TestSweepTimesOutThenPurges();
  TestStartStopIsIdempotent();
  std::cout << "jobguard_unit_maintenance_worker: pass\n";
  return 0;
}
