#include "stop_token.hpp"

namespace jobguard::util {

void StopToken::RequestStop() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

bool StopToken::StopRequested() const {
  return stopped_.load();
}

bool StopToken::WaitFor(std::chrono::milliseconds duration) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, duration, [this] { return stopped_.load(); });
  return !stopped_.load();
}

} // namespace jobguard::util
