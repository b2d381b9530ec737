#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace jobguard::claim {

/*
  Process-local set of idempotency keys currently inside a claim.

  Closes the window between "read the ledger" and "commit the claim"
  for callers in the same process. Acquisition never blocks: a second
  caller for the same key is told the key is busy.
*/
class LocalLockTable {
 public:
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    ~Guard();

    Guard(const Guard&)            = delete;
    Guard& operator=(const Guard&) = delete;

    const std::string& Key() const {
      return key_;
    }

   private:
    friend class LocalLockTable;
    Guard(LocalLockTable* table, std::string key);
    void Reset();

    LocalLockTable* table_;
    std::string     key_;
  };

  // nullopt when another caller in this process holds the key.
  std::optional<Guard> TryAcquire(const std::string& key);

  bool        IsHeld(const std::string& key) const;
  std::size_t Size() const;

 private:
  void Release(const std::string& key);

  mutable std::mutex              mutex_;
  std::unordered_set<std::string> held_;
};

} // namespace jobguard::claim
