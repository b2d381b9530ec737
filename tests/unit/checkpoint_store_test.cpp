#include "internal/checkpoint/checkpoint_store.hpp"

#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using google::protobuf::util::MessageDifferencer;
using jobguard::checkpoint::CheckpointFiles;
using jobguard::checkpoint::CheckpointStore;
using jobguard::checkpoint::CheckpointStoreOptions;
using jobguard::core::v1::Checkpoint;
using jobguard::core::v1::SessionSnapshot;
using jobguard::util::IntegrityError;

namespace st = jobguard::state;

struct ManualClock {
  jobguard::util::TimePoint now = jobguard::util::FromUnixMillis(1700000000000);

  jobguard::util::NowFn Fn() {
    return [this] { return now; };
  }
};

std::filesystem::path FreshDirectory(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "jobguard_checkpoint_store_tests" / (test_name + "_" + jobguard::util::PrefixedId(""));
  std::filesystem::remove_all(dir);
  return dir;
}

struct Fixture {
  explicit Fixture(const std::string& test_name, CheckpointStoreOptions options = {})
      : dir(FreshDirectory(test_name)),
        repo(std::make_shared<jobguard::db::memory::MemoryRepository>()),
        store(repo, std::make_shared<CheckpointFiles>(dir.string(), false), options, clock.Fn()) {
  }

  std::filesystem::path FileFor(const std::string& id, std::string_view extension) const {
    return dir / (id + std::string(extension));
  }

  ManualClock                                              clock;
  std::filesystem::path                                    dir;
  std::shared_ptr<jobguard::db::memory::MemoryRepository> repo;
  CheckpointStore                                          store;
};

Checkpoint MakeCheckpoint(const std::string& session_id, int64_t step, int64_t total = 10) {
  Checkpoint checkpoint;
  checkpoint.set_session_id(session_id);
  checkpoint.set_automation_type("invoice_portal");
  checkpoint.set_current_step(step);
  checkpoint.set_total_steps(total);
  *checkpoint.mutable_state_data() =
      st::MapOf({{"form", st::MakeMap({{"amount", st::MakeDecimal("99.90")}, {"pdf", st::MakeBytes(std::string("%PDF\x00\x01", 6))}})},
                 {"visited", st::MakeList({st::MakeString("login"), st::MakeString("upload")})},
                 {"started_at", st::MakeTimestamp(jobguard::util::FromUnixMillis(1699999999000))}});
  *checkpoint.mutable_execution_context() = st::MapOf({{"url", st::MakeString("https://portal.example")}});
  return checkpoint;
}

void FlipByte(const std::filesystem::path& path, std::size_t offset) {
  std::string bytes;
  {
    std::ifstream in(path, std::ios::binary);
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  assert(offset < bytes.size());
  bytes[offset] = static_cast<char>(bytes[offset] ^ 0x20);

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << bytes;
}

void TestSaveThenLoadReturnsSameState() {
  Fixture fx("roundtrip");

  const auto original = MakeCheckpoint("session-1", 3);
  const auto saved    = fx.store.Save(original);

  assert(!saved.checkpoint_id().empty());
  assert(saved.compression_type() == jobguard::core::v1::COMPRESSION_TYPE_GZIP);
  assert(saved.data_size_bytes() == std::filesystem::file_size(fx.FileFor(saved.checkpoint_id(), jobguard::checkpoint::kCheckpointExtension)));
  assert(saved.checksum().size() == 64);

  const auto loaded = fx.store.Load(saved.checkpoint_id());
  assert(MessageDifferencer::Equals(loaded, saved));
  assert(MessageDifferencer::Equals(loaded.state_data(), original.state_data()));

  const auto report = fx.store.ValidateIntegrity(saved.checkpoint_id());
  assert(report.valid);
  assert(report.integrity_score == 1.0);
}

void TestFlippedByteIsDetected() {
  Fixture fx("tamper");

  const auto saved = fx.store.Save(MakeCheckpoint("session-1", 1));
  const auto path  = fx.FileFor(saved.checkpoint_id(), jobguard::checkpoint::kCheckpointExtension);

  for (std::size_t offset : {std::size_t{0}, static_cast<std::size_t>(saved.data_size_bytes() / 2), static_cast<std::size_t>(saved.data_size_bytes() - 1)}) {
    FlipByte(path, offset);

    bool threw = false;
    try {
      (void)fx.store.Load(saved.checkpoint_id());
    } catch (const IntegrityError& e) {
      threw = e.kind() == IntegrityError::Kind::kChecksumMismatch;
    }
    assert(threw);

    const auto report = fx.store.ValidateIntegrity(saved.checkpoint_id());
    assert(!report.valid);
    assert(report.kind == IntegrityError::Kind::kChecksumMismatch);
    assert(report.integrity_score == 0.1);

    FlipByte(path, offset);
  }

  assert(fx.store.ValidateIntegrity(saved.checkpoint_id()).valid);
}

void TestMissingAndTruncatedFilesAreIntegrityErrors() {
  Fixture fx("missing");

  const auto truncated = fx.store.Save(MakeCheckpoint("session-1", 1));
  std::filesystem::resize_file(fx.FileFor(truncated.checkpoint_id(), jobguard::checkpoint::kCheckpointExtension), 3);
  assert(fx.store.ValidateIntegrity(truncated.checkpoint_id()).kind == IntegrityError::Kind::kSizeMismatch);

  const auto missing = fx.store.Save(MakeCheckpoint("session-1", 2));
  std::filesystem::remove(fx.FileFor(missing.checkpoint_id(), jobguard::checkpoint::kCheckpointExtension));

  bool threw = false;
  try {
    (void)fx.store.Load(missing.checkpoint_id());
  } catch (const IntegrityError& e) {
    threw = e.kind() == IntegrityError::Kind::kMissing;
  }
  assert(threw);

  threw = false;
  try {
    (void)fx.store.Load("chk_unknown");
  } catch (const jobguard::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSessionOrderingIsEnforced() {
  Fixture fx("ordering");

  const auto a = fx.store.Save(MakeCheckpoint("session-1", 4));
  const auto b = fx.store.Save(MakeCheckpoint("session-1", 4));
  assert(b.created_at().seconds() * 1000 + b.created_at().nanos() / 1000000 > a.created_at().seconds() * 1000 + a.created_at().nanos() / 1000000);

  bool threw = false;
  try {
    (void)fx.store.Save(MakeCheckpoint("session-1", 3));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  // Other sessions are independent.
  (void)fx.store.Save(MakeCheckpoint("session-2", 1));

  const auto latest = fx.store.LatestCheckpoint("session-1");
  assert(latest);
  assert(latest->checkpoint_id == b.checkpoint_id());
}

void TestOldestCheckpointsArePrunedPerSession() {
  CheckpointStoreOptions options;
  options.max_per_session = 3;
  Fixture fx("prune", options);

  std::string first_id;
  for (int64_t step = 1; step <= 5; ++step) {
    const auto saved = fx.store.Save(MakeCheckpoint("session-1", step));
    if (step == 1) first_id = saved.checkpoint_id();
  }

  const auto records = fx.store.ListCheckpoints("session-1");
  assert(records.size() == 3);
  assert(records.front().current_step == 3);
  assert(records.back().current_step == 5);
  assert(!std::filesystem::exists(fx.FileFor(first_id, jobguard::checkpoint::kCheckpointExtension)));
}

void TestSnapshotCarriesStepCounters() {
  Fixture fx("snapshot");

  SessionSnapshot snapshot;
  snapshot.set_session_id("session-1");
  *snapshot.mutable_automation_state() = st::MapOf({{"current_step", st::MakeInt(7)}, {"total_steps", st::MakeInt(12)}});
  snapshot.set_screenshot_data(std::string(2048, 'x'));

  const auto saved  = fx.store.SaveSnapshot(snapshot);
  const auto record = fx.store.GetSnapshotRecord(saved.snapshot_id());
  assert(record);
  assert(record->current_step == 7);
  assert(record->total_steps == 12);

  const auto loaded = fx.store.LoadSnapshot(saved.snapshot_id());
  assert(loaded.screenshot_data() == snapshot.screenshot_data());
  assert(fx.store.ValidateSnapshotIntegrity(saved.snapshot_id()).valid);
}

void TestCleanupRemovesExpiredFilesAndRows() {
  Fixture fx("cleanup");

  const auto old_checkpoint = fx.store.Save(MakeCheckpoint("session-1", 1));
  SessionSnapshot snapshot;
  snapshot.set_session_id("session-1");
  const auto old_snapshot = fx.store.SaveSnapshot(snapshot);

  fx.clock.now += std::chrono::hours(24 * 40);
  const auto fresh = fx.store.Save(MakeCheckpoint("session-1", 2));

  const auto cleaned = fx.store.CleanupOlderThan(std::chrono::hours(24 * 30));
  assert(cleaned.checkpoints_deleted == 1);
  assert(cleaned.snapshots_deleted == 1);

  assert(!fx.store.GetCheckpointRecord(old_checkpoint.checkpoint_id()));
  assert(!fx.store.GetSnapshotRecord(old_snapshot.snapshot_id()));
  assert(!std::filesystem::exists(fx.FileFor(old_checkpoint.checkpoint_id(), jobguard::checkpoint::kCheckpointExtension)));
  assert(fx.store.GetCheckpointRecord(fresh.checkpoint_id()));
}

} // namespace

int main() {
  TestSaveThenLoadReturnsSameState();
  TestFlippedByteIsDetected();
  TestMissingAndTruncatedFilesAreIntegrityErrors();
  TestSessionOrderingIsEnforced();
  TestOldestCheckpointsArePrunedPerSession();
  TestSnapshotCarriesStepCounters();
  TestCleanupRemovesExpiredFilesAndRows();

  std::cout << "jobguard_unit_checkpoint_store: pass\n";
  return 0;
}
