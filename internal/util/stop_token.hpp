#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace jobguard::util {

/*
  Cancellation flag with an interruptible sleep.

  Shared by backoff waits and periodic background loops so that Stop()
  wakes any sleeper immediately.
*/
class StopToken {
 public:
  void RequestStop();
  bool StopRequested() const;

  // Sleeps up to `duration`. Returns false if stop was requested.
  bool WaitFor(std::chrono::milliseconds duration);

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       stopped_{false};
};

} // namespace jobguard::util
