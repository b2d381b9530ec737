#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "internal/claim/idempotency_key.hpp"
#include "internal/claim/local_lock_table.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/job_status.hpp"
#include "internal/util/time.hpp"
#include "jobguard/core/v1/value.pb.h"

namespace jobguard::claim {

// The caller now owns the job.
struct Claimed {
  uint64_t job_id      = 0;
  bool     reclaimed   = false;
  uint32_t retry_count = 0;
};

// The job already finished; its side effects must not run again.
struct AlreadyProcessed {
  uint64_t                       job_id = 0;
  model::JobStatus               status = model::JobStatus::kCompleted;
  std::optional<core::v1::Value> result;
  std::string                    error;
};

// A live claim exists. job_id is unset when the key is busy in this process.
struct HeldByOther {
  std::optional<uint64_t> job_id;
  std::string             holder;
};

using ClaimOutcome = std::variant<Claimed, AlreadyProcessed, HeldByOther>;

std::string_view OutcomeName(const ClaimOutcome& outcome);

struct ClaimStoreOptions {
  int max_conflict_attempts = 8;
};

/*
  ClaimStore

  Job ledger keyed by idempotency key. The repository transaction is
  the only cross-worker coordination point; the local lock table only
  deduplicates callers inside this process.
*/
class ClaimStore {
 public:
  ClaimStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<LocalLockTable> locks, util::NowFn now = util::Now,
             ClaimStoreOptions options = {});

  ClaimOutcome Claim(const IdempotencyKey& key, const std::string& worker_id, std::chrono::seconds timeout);

  /*
    Applies an allowed status transition. Returns false (and logs) when
    the transition is not allowed, or when worker_id is given and no
    longer holds the claim; the row is left untouched.
    Throws util::NotFound for an unknown job.
  */
  bool Transition(uint64_t job_id, model::JobStatus new_status, const std::string& error_message = {},
                  const std::optional<core::v1::Value>& result = std::nullopt, const std::optional<std::string>& worker_id = std::nullopt);

  // Refreshes claimed_at when worker_id still holds an active claim.
  bool Heartbeat(uint64_t job_id, const std::string& worker_id);

  // CLAIMED / PROCESSING rows claimed more than retention ago become TIMEOUT.
  uint64_t CleanupStale(std::chrono::hours retention);

  // Deletes terminal rows last updated more than retention ago.
  uint64_t PurgeTerminal(std::chrono::hours retention);

  std::optional<db::model::JobRecord> GetJob(uint64_t job_id);
  std::optional<db::model::JobRecord> GetJobByKey(const std::string& key);

  static std::optional<core::v1::Value> DecodeResult(const db::model::JobRecord& record);

 private:
  ClaimOutcome ClaimOnce(const IdempotencyKey& key, const std::string& worker_id, std::chrono::seconds timeout);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<LocalLockTable> locks_;
  util::NowFn                     now_;
  ClaimStoreOptions               options_;
};

} // namespace jobguard::claim
