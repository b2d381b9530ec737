#pragma once

#include <chrono>
#include <random>
#include <thread>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::db {

// Turns a conflicting repository result into the exception RetryOnConflict retries.
inline void ThrowIfConflict(const Result& result) {
  if (!result && result.IsConflict()) {
    throw util::TransactionConflict(result.message.empty() ? "write conflict" : result.message);
  }
}

/*
  Runs `fn` (which opens, uses and commits its own transaction) and
  re-runs it when a concurrent writer won. Jittered sleep between
  attempts; the last conflict is rethrown.
*/
template <typename Fn>
auto RetryOnConflict(int max_attempts, Fn&& fn) -> decltype(fn()) {
  thread_local std::mt19937 rng{std::random_device{}()};

  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const util::TransactionConflict&) {
      if (attempt >= max_attempts) throw;
    }
    std::uniform_int_distribution<int> jitter(1, 5 * attempt);
    std::this_thread::sleep_for(std::chrono::milliseconds(jitter(rng)));
  }
}

} // namespace jobguard::db
