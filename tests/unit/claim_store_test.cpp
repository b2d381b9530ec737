#include "internal/claim/claim_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobguard::claim::AlreadyProcessed;
using jobguard::claim::Claimed;
using jobguard::claim::ClaimOutcome;
using jobguard::claim::ClaimStore;
using jobguard::claim::ComputeIdempotencyKey;
using jobguard::claim::HeldByOther;
using jobguard::claim::LocalLockTable;
using jobguard::model::JobStatus;

namespace st = jobguard::state;

struct ManualClock {
  jobguard::util::TimePoint now = jobguard::util::FromUnixMillis(1700000000000);

  jobguard::util::NowFn Fn() {
    return [this] { return now; };
  }
};

jobguard::claim::IdempotencyKey MakeKey(int64_t ticket = 42) {
  return ComputeIdempotencyKey(ticket, "invoice_portal", st::MapOf({{"url", st::MakeString("https://x")}}));
}

void TestFirstClaimCreatesJob() {
  auto       repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ClaimStore store(repo, std::make_shared<LocalLockTable>());

  const auto outcome = store.Claim(MakeKey(), "worker-a", std::chrono::seconds(300));
  const auto* claimed = std::get_if<Claimed>(&outcome);
  assert(claimed);
  assert(!claimed->reclaimed);
  assert(claimed->retry_count == 0);

  const auto record = store.GetJob(claimed->job_id);
  assert(record);
  assert(record->status == JobStatus::kClaimed);
  assert(record->claimed_by == "worker-a");
  assert(record->idempotency_key == MakeKey().ToString());
  assert(record->ticket_id == 42);
}

void TestLiveClaimIsHeldByOther() {
  auto       repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ClaimStore store(repo, std::make_shared<LocalLockTable>());

  const auto first  = store.Claim(MakeKey(), "worker-a", std::chrono::seconds(300));
  const auto second = store.Claim(MakeKey(), "worker-b", std::chrono::seconds(300));

  const auto* held = std::get_if<HeldByOther>(&second);
  assert(held);
  assert(held->job_id == std::get<Claimed>(first).job_id);
  assert(held->holder == "worker-a");
}

void TestConcurrentClaimsAcrossProcessesHaveOneWinner() {
  // Two stores with their own lock tables model two processes sharing
  // only the repository.
  auto repo = std::make_shared<jobguard::db::memory::MemoryRepository>();

  for (int round = 0; round < 20; ++round) {
    ClaimStore a(repo, std::make_shared<LocalLockTable>());
    ClaimStore b(repo, std::make_shared<LocalLockTable>());
    const auto key = MakeKey(1000 + round);

    std::atomic<int>           ready{0};
    std::vector<ClaimOutcome>  outcomes(2);
    std::thread                ta([&] {
      ready.fetch_add(1);
      while (ready.load() < 2) std::this_thread::yield();
      outcomes[0] = a.Claim(key, "worker-a", std::chrono::seconds(300));
    });
    std::thread tb([&] {
      ready.fetch_add(1);
      while (ready.load() < 2) std::this_thread::yield();
      outcomes[1] = b.Claim(key, "worker-b", std::chrono::seconds(300));
    });
    ta.join();
    tb.join();

    int claimed = 0;
    for (const auto& outcome : outcomes) {
      if (std::holds_alternative<Claimed>(outcome)) {
        ++claimed;
      } else {
        assert(std::holds_alternative<HeldByOther>(outcome) || std::holds_alternative<AlreadyProcessed>(outcome));
      }
    }
    assert(claimed == 1);
  }
}

void TestStaleClaimIsReclaimed() {
  auto        repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ManualClock clock;
  ClaimStore  store(repo, std::make_shared<LocalLockTable>(), clock.Fn());

  const auto first = std::get<Claimed>(store.Claim(MakeKey(), "worker-a", std::chrono::seconds(5)));

  clock.now += std::chrono::seconds(4);
  assert(std::holds_alternative<HeldByOther>(store.Claim(MakeKey(), "worker-b", std::chrono::seconds(5))));

  clock.now += std::chrono::seconds(2);
  const auto outcome = store.Claim(MakeKey(), "worker-b", std::chrono::seconds(5));
  const auto* claimed = std::get_if<Claimed>(&outcome);
  assert(claimed);
  assert(claimed->job_id == first.job_id);
  assert(claimed->reclaimed);
  assert(claimed->retry_count == 1);

  const auto record = store.GetJob(first.job_id);
  assert(record->claimed_by == "worker-b");

  // The previous holder can no longer keep the claim alive.
  assert(!store.Heartbeat(first.job_id, "worker-a"));
  assert(store.Heartbeat(first.job_id, "worker-b"));
}

void TestFinishedJobReturnsStoredResult() {
  auto       repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ClaimStore store(repo, std::make_shared<LocalLockTable>());

  const auto claimed = std::get<Claimed>(store.Claim(MakeKey(), "worker-a", std::chrono::seconds(300)));
  assert(store.Transition(claimed.job_id, JobStatus::kProcessing));
  assert(store.Transition(claimed.job_id, JobStatus::kCompleted, {}, st::MakeMap({{"invoice_id", st::MakeString("INV-7")}})));

  const auto outcome = store.Claim(MakeKey(), "worker-b", std::chrono::seconds(300));
  const auto* done = std::get_if<AlreadyProcessed>(&outcome);
  assert(done);
  assert(done->job_id == claimed.job_id);
  assert(done->status == JobStatus::kCompleted);
  assert(done->result);
  assert(done->result->map_value().fields().at("invoice_id").string_value() == "INV-7");

  const auto record = store.GetJob(claimed.job_id);
  assert(record->completed_at_ms);
}

void TestInvalidTransitionsLeaveRowUntouched() {
  auto       repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ClaimStore store(repo, std::make_shared<LocalLockTable>());

  const auto claimed = std::get<Claimed>(store.Claim(MakeKey(), "worker-a", std::chrono::seconds(300)));

  assert(!store.Transition(claimed.job_id, JobStatus::kCompleted));
  assert(store.GetJob(claimed.job_id)->status == JobStatus::kClaimed);

  assert(store.Transition(claimed.job_id, JobStatus::kCancelled, "operator"));
  assert(!store.Transition(claimed.job_id, JobStatus::kProcessing));
  assert(store.GetJob(claimed.job_id)->status == JobStatus::kCancelled);

  bool threw = false;
  try {
    (void)store.Transition(9999, JobStatus::kProcessing);
  } catch (const jobguard::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestReclaimedJobRejectsFormerHolder() {
  auto        repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ManualClock clock;
  ClaimStore  store(repo, std::make_shared<LocalLockTable>(), clock.Fn());

  const auto first = std::get<Claimed>(store.Claim(MakeKey(), "worker-a", std::chrono::seconds(5)));
  assert(store.Transition(first.job_id, JobStatus::kProcessing, {}, std::nullopt, "worker-a"));

  clock.now += std::chrono::seconds(6);
  const auto second = std::get<Claimed>(store.Claim(MakeKey(), "worker-b", std::chrono::seconds(5)));
  assert(second.job_id == first.job_id);
  assert(second.reclaimed);
  assert(store.Transition(second.job_id, JobStatus::kProcessing, {}, std::nullopt, "worker-b"));

  // worker-a finishing late must not overwrite worker-b's run.
  assert(!store.Transition(first.job_id, JobStatus::kCompleted, {}, st::MakeString("stale"), "worker-a"));
  auto record = store.GetJob(first.job_id);
  assert(record->status == JobStatus::kProcessing);
  assert(record->claimed_by == "worker-b");
  assert(!record->result);

  assert(store.Transition(second.job_id, JobStatus::kCompleted, {}, st::MakeString("fresh"), "worker-b"));
  record = store.GetJob(second.job_id);
  assert(record->status == JobStatus::kCompleted);
  assert(ClaimStore::DecodeResult(*record)->string_value() == "fresh");
}

void TestCleanupStaleOnlyTouchesActiveJobs() {
  auto        repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ManualClock clock;
  ClaimStore  store(repo, std::make_shared<LocalLockTable>(), clock.Fn());

  const auto processing = std::get<Claimed>(store.Claim(MakeKey(1), "worker-a", std::chrono::seconds(300)));
  assert(store.Transition(processing.job_id, JobStatus::kProcessing));

  const auto completed = std::get<Claimed>(store.Claim(MakeKey(2), "worker-a", std::chrono::seconds(300)));
  assert(store.Transition(completed.job_id, JobStatus::kProcessing));
  assert(store.Transition(completed.job_id, JobStatus::kCompleted));

  clock.now += std::chrono::hours(48);

  assert(store.CleanupStale(std::chrono::hours(24)) == 1);
  assert(store.GetJob(processing.job_id)->status == JobStatus::kTimeout);
  assert(store.GetJob(completed.job_id)->status == JobStatus::kCompleted);

  // A timed out job is claimable again.
  const auto again = store.Claim(MakeKey(1), "worker-b", std::chrono::seconds(300));
  assert(std::holds_alternative<Claimed>(again));
  assert(std::get<Claimed>(again).job_id == processing.job_id);
}

void TestPurgeTerminalRespectsRetention() {
  auto        repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  ManualClock clock;
  ClaimStore  store(repo, std::make_shared<LocalLockTable>(), clock.Fn());

  const auto old_job = std::get<Claimed>(store.Claim(MakeKey(1), "worker-a", std::chrono::seconds(300)));
  assert(store.Transition(old_job.job_id, JobStatus::kCancelled));

  clock.now += std::chrono::hours(24 * 10);

  const auto fresh_job = std::get<Claimed>(store.Claim(MakeKey(2), "worker-a", std::chrono::seconds(300)));
  assert(store.Transition(fresh_job.job_id, JobStatus::kCancelled));

  assert(store.PurgeTerminal(std::chrono::hours(24 * 7)) == 1);
  assert(!store.GetJob(old_job.job_id));
  assert(store.GetJob(fresh_job.job_id));
}

} // namespace

int main() {
  TestFirstClaimCreatesJob();
  TestLiveClaimIsHeldByOther();
  TestConcurrentClaimsAcrossProcessesHaveOneWinner();
  TestStaleClaimIsReclaimed();
  TestFinishedJobReturnsStoredResult();
  TestInvalidTransitionsLeaveRowUntouched();
  TestReclaimedJobRejectsFormerHolder();
  TestCleanupStaleOnlyTouchesActiveJobs();
  TestPurgeTerminalRespectsRetention();

  std::cout << "jobguard_unit_claim_store: pass\n";
  return 0;
}
