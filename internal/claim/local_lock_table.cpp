#include "internal/claim/local_lock_table.hpp"

#include <utility>

namespace jobguard::claim {

LocalLockTable::Guard::Guard(LocalLockTable* table, std::string key) : table_(table), key_(std::move(key)) {
}

LocalLockTable::Guard::Guard(Guard&& other) noexcept : table_(std::exchange(other.table_, nullptr)), key_(std::move(other.key_)) {
}

LocalLockTable::Guard& LocalLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    Reset();
    table_ = std::exchange(other.table_, nullptr);
    key_   = std::move(other.key_);
  }
  return *this;
}

LocalLockTable::Guard::~Guard() {
  Reset();
}

void LocalLockTable::Guard::Reset() {
  if (table_) {
    table_->Release(key_);
    table_ = nullptr;
  }
}

std::optional<LocalLockTable::Guard> LocalLockTable::TryAcquire(const std::string& key) {
  std::lock_guard lock(mutex_);
  if (!held_.insert(key).second) return std::nullopt;
  return Guard(this, key);
}

bool LocalLockTable::IsHeld(const std::string& key) const {
  std::lock_guard lock(mutex_);
  return held_.contains(key);
}

std::size_t LocalLockTable::Size() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

void LocalLockTable::Release(const std::string& key) {
  std::lock_guard lock(mutex_);
  held_.erase(key);
}

} // namespace jobguard::claim
