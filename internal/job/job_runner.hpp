#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/automation/step_log.hpp"
#include "internal/claim/claim_store.hpp"
#include "internal/persistence/persistence_coordinator.hpp"
#include "jobguard/core/v1/value.pb.h"

namespace jobguard::job {

enum class JobOutcomeKind {
  kCompleted,
  kFailed,
  kInProgress,
  kAlreadyProcessed,
};

std::string_view ToString(JobOutcomeKind kind);

/*
  The only thing a business caller sees. Retry, reclaim and recovery
  show up solely through retry_count, from_cache and
  requires_human_intervention.
*/
struct JobOutcome {
  JobOutcomeKind kind   = JobOutcomeKind::kFailed;
  uint64_t       job_id = 0;

  std::optional<core::v1::Value> result;
  std::string                    error;

  uint32_t retry_count                 = 0;
  bool     from_cache                  = false;
  bool     requires_human_intervention = false;
};

class JobContext {
 public:
  JobContext(uint64_t job_id, claim::IdempotencyKey key, core::v1::MapValue config, std::string worker_id, claim::ClaimStore& claims,
             persistence::PersistenceCoordinator& coordinator, automation::StepLog& steps, std::optional<recovery::RecoveryResult> recovery);

  uint64_t job_id() const {
    return job_id_;
  }

  // "job-<id>": checkpoints, snapshots and steps of this job live here.
  const std::string& session_id() const {
    return session_id_;
  }

  const claim::IdempotencyKey& key() const {
    return key_;
  }

  const core::v1::MapValue& config() const {
    return config_;
  }

  // Set when the job was reclaimed from a stale worker.
  const std::optional<recovery::RecoveryResult>& recovery() const {
    return recovery_;
  }

  persistence::PersistenceCoordinator& coordinator() {
    return coordinator_;
  }

  automation::StepLog& steps() {
    return steps_;
  }

  // Keeps the claim fresh for long jobs. False once the claim was lost.
  bool Heartbeat();

 private:
  uint64_t                                job_id_;
  std::string                             session_id_;
  claim::IdempotencyKey                   key_;
  core::v1::MapValue                      config_;
  std::string                             worker_id_;
  claim::ClaimStore&                      claims_;
  persistence::PersistenceCoordinator&    coordinator_;
  automation::StepLog&                    steps_;
  std::optional<recovery::RecoveryResult> recovery_;
};

struct ProcessResult {
  bool                           success = false;
  std::optional<core::v1::Value> result;
  std::string                    error;
  bool                           requires_human_intervention = false;
};

/*
  Business logic for one operation type. Exceptions thrown from
  Process() fail the job with the exception message.
*/
class JobProcessor {
 public:
  virtual ~JobProcessor() = default;

  virtual ProcessResult Process(JobContext& context) = 0;
};

struct JobRunnerOptions {
  std::string          worker_id;
  std::chrono::seconds claim_timeout{300};
};

/*
  JobRunner

  submitJob pipeline: idempotency key -> claim -> PROCESSING -> recovery
  (reclaims only) -> processor -> COMPLETED / FAILED.
*/
class JobRunner {
 public:
  JobRunner(std::shared_ptr<claim::ClaimStore> claims, std::shared_ptr<persistence::PersistenceCoordinator> coordinator,
            std::shared_ptr<db::Repository> repository, JobRunnerOptions options);

  void RegisterProcessor(const std::string& operation_type, std::shared_ptr<JobProcessor> processor);

  JobOutcome SubmitJob(int64_t ticket_id, const std::string& operation_type, const core::v1::MapValue& config);

 private:
  std::shared_ptr<JobProcessor> ProcessorFor(const std::string& operation_type) const;

  JobOutcome Run(const claim::Claimed& claimed, const claim::IdempotencyKey& key, const core::v1::MapValue& config, JobProcessor& processor);

  std::shared_ptr<claim::ClaimStore>                   claims_;
  std::shared_ptr<persistence::PersistenceCoordinator> coordinator_;
  std::shared_ptr<db::Repository>                      repository_;
  JobRunnerOptions                                     options_;

  mutable std::mutex                                   mutex_;
  std::map<std::string, std::shared_ptr<JobProcessor>> processors_;
};

std::string SessionIdForJob(uint64_t job_id);

} // namespace jobguard::job
