#include "internal/claim/claim_store.hpp"

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/state/state_codec.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::claim {

using db::model::JobRecord;
using model::JobStatus;

namespace {

void CheckWrite(const db::Result& result, const char* what) {
  db::ThrowIfConflict(result);
  if (!result) {
    throw std::runtime_error(std::string(what) + ": " + result.message);
  }
}

} // namespace

std::string_view OutcomeName(const ClaimOutcome& outcome) {
  if (const auto* claimed = std::get_if<Claimed>(&outcome)) {
    return claimed->reclaimed ? "reclaimed" : "claimed";
  }
  if (std::holds_alternative<AlreadyProcessed>(outcome)) {
    return "already_processed";
  }
  return "held_by_other";
}

ClaimStore::ClaimStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<LocalLockTable> locks, util::NowFn now, ClaimStoreOptions options)
    : repository_(std::move(repository)), locks_(std::move(locks)), now_(std::move(now)), options_(options) {
  if (!repository_) throw util::InvalidArgument("ClaimStore requires a repository");
  if (!locks_) locks_ = std::make_shared<LocalLockTable>();
  if (!now_) now_ = util::Now;
}

ClaimOutcome ClaimStore::Claim(const IdempotencyKey& key, const std::string& worker_id, std::chrono::seconds timeout) {
  if (worker_id.empty()) throw util::InvalidArgument("worker id must not be empty");
  if (timeout.count() <= 0) throw util::InvalidArgument("claim timeout must be positive");

  observability::SpanScope span("ClaimStore.Claim");
  const auto               key_str = key.ToString();
  span.SetAttribute("jobguard.idempotency_key", key_str);

  // Released on every exit path, including exceptions.
  auto guard = locks_->TryAcquire(key_str);
  if (!guard) {
    JOBGUARD_LOG_DEBUG("claim busy in process", {observability::StringField("key", key_str)});
    ClaimOutcome outcome = HeldByOther{std::nullopt, worker_id};
    observability::Metrics::Instance().RecordClaimOutcome(OutcomeName(outcome));
    return outcome;
  }

  auto outcome = db::RetryOnConflict(options_.max_conflict_attempts, [&] { return ClaimOnce(key, worker_id, timeout); });

  observability::Metrics::Instance().RecordClaimOutcome(OutcomeName(outcome));
  span.SetAttribute("jobguard.claim.outcome", OutcomeName(outcome));
  return outcome;
}

ClaimOutcome ClaimStore::ClaimOnce(const IdempotencyKey& key, const std::string& worker_id, std::chrono::seconds timeout) {
  const auto key_str = key.ToString();
  const auto now_ms  = util::ToUnixMillis(now_());
  const auto timeout_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count());

  auto tx       = repository_->Begin();
  auto existing = repository_->GetJobByKey(*tx, key_str);

  if (!existing) {
    JobRecord record;
    record.idempotency_key = key_str;
    record.ticket_id       = key.ticket_id;
    record.operation_type  = key.operation_type;
    record.status          = JobStatus::kClaimed;
    record.claimed_by      = worker_id;
    record.claimed_at_ms   = now_ms;
    record.created_at_ms   = now_ms;
    record.updated_at_ms   = now_ms;

    CheckWrite(repository_->InsertJob(*tx, record), "insert job");
    tx->Commit();

    JOBGUARD_LOG_INFO("job claimed", {observability::IntField("job_id", static_cast<int64_t>(record.id)), observability::StringField("key", key_str),
                                      observability::StringField("worker", worker_id)});
    return Claimed{record.id, false, 0};
  }

  JobRecord record = *existing;

  if (record.status == JobStatus::kCompleted || record.status == JobStatus::kFailed) {
    tx->Commit();
    return AlreadyProcessed{record.id, record.status, DecodeResult(record), record.error_message};
  }

  if (model::IsActive(record.status)) {
    // A claimed_at in the future (clock skew) counts as fresh.
    const bool stale = now_ms >= record.claimed_at_ms && now_ms - record.claimed_at_ms >= timeout_ms;
    if (!stale) {
      tx->Commit();
      return HeldByOther{record.id, record.claimed_by};
    }
  }

  // Stale active claim, or PENDING / TIMEOUT / CANCELLED: take it over.
  const auto previous_holder = record.claimed_by;
  const auto previous_status = record.status;

  record.status        = JobStatus::kClaimed;
  record.claimed_by    = worker_id;
  record.claimed_at_ms = now_ms;
  record.updated_at_ms = now_ms;
  record.completed_at_ms.reset();
  record.error_message.clear();
  record.retry_count++;

  CheckWrite(repository_->UpdateJob(*tx, record), "reclaim job");
  tx->Commit();

  JOBGUARD_LOG_INFO("job reclaimed",
                    {observability::IntField("job_id", static_cast<int64_t>(record.id)), observability::StringField("key", key_str),
                     observability::StringField("worker", worker_id), observability::StringField("previous_holder", previous_holder),
                     observability::StringField("previous_status", model::ToString(previous_status)),
                     observability::IntField("retry_count", record.retry_count)});
  return Claimed{record.id, true, record.retry_count};
}

bool ClaimStore::Transition(uint64_t job_id, JobStatus new_status, const std::string& error_message, const std::optional<core::v1::Value>& result,
                            const std::optional<std::string>& worker_id) {
  std::optional<std::string> encoded_result;
  if (result) {
    encoded_result = state::StateCodec::SerializeValue(*result);
  }

  return db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetJob(*tx, job_id);
    if (!record) {
      throw util::NotFound("job not found: " + std::to_string(job_id));
    }

    if (worker_id && record->claimed_by != *worker_id) {
      JOBGUARD_LOG_WARN("job transition by non-holder ignored",
                        {observability::IntField("job_id", static_cast<int64_t>(job_id)), observability::StringField("worker", *worker_id),
                         observability::StringField("holder", record->claimed_by), observability::StringField("to", model::ToString(new_status))});
      tx->Commit();
      return false;
    }

    if (!model::CanTransition(record->status, new_status)) {
      JOBGUARD_LOG_WARN("invalid job transition ignored",
                        {observability::IntField("job_id", static_cast<int64_t>(job_id)), observability::StringField("from", model::ToString(record->status)),
                         observability::StringField("to", model::ToString(new_status))});
      tx->Commit();
      return false;
    }

    const auto now_ms     = util::ToUnixMillis(now_());
    record->status        = new_status;
    record->updated_at_ms = now_ms;
    if (!error_message.empty()) record->error_message = error_message;
    if (encoded_result) record->result = encoded_result;
    if (new_status == JobStatus::kCompleted || new_status == JobStatus::kFailed) {
      record->completed_at_ms = now_ms;
    }

    CheckWrite(repository_->UpdateJob(*tx, *record), "transition job");
    tx->Commit();

    if (model::IsTerminal(new_status)) {
      observability::Metrics::Instance().RecordJobOutcome(model::ToString(new_status));
    }
    JOBGUARD_LOG_INFO("job transitioned",
                      {observability::IntField("job_id", static_cast<int64_t>(job_id)), observability::StringField("status", model::ToString(new_status))});
    return true;
  });
}

bool ClaimStore::Heartbeat(uint64_t job_id, const std::string& worker_id) {
  return db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto tx     = repository_->Begin();
    auto record = repository_->GetJob(*tx, job_id);
    if (!record || !model::IsActive(record->status) || record->claimed_by != worker_id) {
      tx->Commit();
      return false;
    }

    const auto now_ms     = util::ToUnixMillis(now_());
    record->claimed_at_ms = now_ms;
    record->updated_at_ms = now_ms;
    CheckWrite(repository_->UpdateJob(*tx, *record), "heartbeat job");
    tx->Commit();
    return true;
  });
}

uint64_t ClaimStore::CleanupStale(std::chrono::hours retention) {
  const auto now    = now_();
  const auto cutoff = util::ToUnixMillis(now - retention);

  auto timed_out = db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto     tx    = repository_->Begin();
    auto     stale = repository_->ListStaleJobs(*tx, cutoff);
    uint64_t count = 0;

    for (auto& record : stale) {
      record.status        = JobStatus::kTimeout;
      record.error_message = "claim expired without completion";
      record.updated_at_ms = util::ToUnixMillis(now);
      CheckWrite(repository_->UpdateJob(*tx, record), "timeout stale job");
      ++count;
    }

    tx->Commit();
    return count;
  });

  if (timed_out > 0) {
    observability::Metrics::Instance().RecordJobOutcome(model::ToString(JobStatus::kTimeout));
    JOBGUARD_LOG_INFO("stale jobs timed out", {observability::IntField("count", static_cast<int64_t>(timed_out)),
                                               observability::IntField("retention_hours", retention.count())});
  }
  return timed_out;
}

uint64_t ClaimStore::PurgeTerminal(std::chrono::hours retention) {
  const auto cutoff = util::ToUnixMillis(now_() - retention);

  auto deleted = db::RetryOnConflict(options_.max_conflict_attempts, [&] {
    auto     tx    = repository_->Begin();
    uint64_t count = 0;
    CheckWrite(repository_->DeleteTerminalJobs(*tx, cutoff, count), "purge terminal jobs");
    tx->Commit();
    return count;
  });

  if (deleted > 0) {
    JOBGUARD_LOG_INFO("terminal jobs purged", {observability::IntField("count", static_cast<int64_t>(deleted))});
  }
  return deleted;
}

std::optional<JobRecord> ClaimStore::GetJob(uint64_t job_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetJob(*tx, job_id);
  tx->Commit();
  return record;
}

std::optional<JobRecord> ClaimStore::GetJobByKey(const std::string& key) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetJobByKey(*tx, key);
  tx->Commit();
  return record;
}

std::optional<core::v1::Value> ClaimStore::DecodeResult(const JobRecord& record) {
  if (!record.result) return std::nullopt;
  return state::StateCodec::ParseValue(*record.result);
}

} // namespace jobguard::claim
