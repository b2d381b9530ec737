#include "internal/claim/local_lock_table.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

namespace {

using jobguard::claim::LocalLockTable;

void TestSecondAcquireIsRefusedUntilRelease() {
  LocalLockTable table;

  {
    auto first = table.TryAcquire("k");
    assert(first.has_value());
    assert(table.IsHeld("k"));
    assert(!table.TryAcquire("k").has_value());
    assert(table.TryAcquire("other").has_value());
  }

  assert(!table.IsHeld("k"));
  assert(table.Size() == 0);
  assert(table.TryAcquire("k").has_value());
}

void TestMovedGuardReleasesOnce() {
  LocalLockTable table;

  auto guard = table.TryAcquire("k");
  assert(guard.has_value());

  LocalLockTable::Guard moved = std::move(*guard);
  guard.reset();
  assert(table.IsHeld("k"));
  assert(moved.Key() == "k");

  {
    LocalLockTable::Guard sink = std::move(moved);
    (void)sink;
  }
  assert(!table.IsHeld("k"));
}

void TestConcurrentAcquireHasOneWinner() {
  LocalLockTable   table;
  std::atomic<int> winners{0};
  std::atomic<int> ready{0};

  std::vector<std::optional<LocalLockTable::Guard>> held(8);
  std::vector<std::thread>                          threads;
  for (size_t i = 0; i < held.size(); ++i) {
    threads.emplace_back([&, i] {
      ready.fetch_add(1);
      while (ready.load() < static_cast<int>(held.size())) std::this_thread::yield();
      held[i] = table.TryAcquire("shared");
      if (held[i]) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
  assert(table.Size() == 1);
}

} // namespace

int main() {
  TestSecondAcquireIsRefusedUntilRelease();
  TestMovedGuardReleasesOnce();
  TestConcurrentAcquireHasOneWinner();

  std::cout << "jobguard_unit_local_lock_table: pass\n";
  return 0;
}
