#include "internal/job/job_runner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::job {

using jobguard::model::JobStatus;

namespace {

// Stops any auto-checkpoint loop the processor left running for the session.
class SessionPersistenceGuard {
 public:
  SessionPersistenceGuard(persistence::PersistenceCoordinator& coordinator, std::string session_id)
      : coordinator_(coordinator), session_id_(std::move(session_id)) {
  }

  ~SessionPersistenceGuard() {
    coordinator_.StopSessionPersistence(session_id_);
  }

  SessionPersistenceGuard(const SessionPersistenceGuard&)            = delete;
  SessionPersistenceGuard& operator=(const SessionPersistenceGuard&) = delete;

 private:
  persistence::PersistenceCoordinator& coordinator_;
  std::string                          session_id_;
};

} // namespace

std::string_view ToString(JobOutcomeKind kind) {
  switch (kind) {
    case JobOutcomeKind::kCompleted:
      return "completed";
    case JobOutcomeKind::kFailed:
      return "failed";
    case JobOutcomeKind::kInProgress:
      return "in_progress";
    case JobOutcomeKind::kAlreadyProcessed:
      return "already_processed";
  }
  return "unknown";
}

std::string SessionIdForJob(uint64_t job_id) {
  return "job-" + std::to_string(job_id);
}

JobContext::JobContext(uint64_t job_id, claim::IdempotencyKey key, core::v1::MapValue config, std::string worker_id, claim::ClaimStore& claims,
                       persistence::PersistenceCoordinator& coordinator, automation::StepLog& steps,
                       std::optional<recovery::RecoveryResult> recovery)
    : job_id_(job_id),
      session_id_(SessionIdForJob(job_id)),
      key_(std::move(key)),
      config_(std::move(config)),
      worker_id_(std::move(worker_id)),
      claims_(claims),
      coordinator_(coordinator),
      steps_(steps),
      recovery_(std::move(recovery)) {
}

bool JobContext::Heartbeat() {
  return claims_.Heartbeat(job_id_, worker_id_);
}

JobRunner::JobRunner(std::shared_ptr<claim::ClaimStore> claims, std::shared_ptr<persistence::PersistenceCoordinator> coordinator,
                     std::shared_ptr<db::Repository> repository, JobRunnerOptions options)
    : claims_(std::move(claims)), coordinator_(std::move(coordinator)), repository_(std::move(repository)), options_(std::move(options)) {
  if (!claims_ || !coordinator_ || !repository_) throw util::InvalidArgument("JobRunner requires a claim store, coordinator and repository");
  if (options_.worker_id.empty()) throw util::InvalidArgument("JobRunner requires a worker id");
  if (options_.claim_timeout.count() <= 0) options_.claim_timeout = std::chrono::seconds(300);
}

void JobRunner::RegisterProcessor(const std::string& operation_type, std::shared_ptr<JobProcessor> processor) {
  if (operation_type.empty() || !processor) throw util::InvalidArgument("processor registration requires an operation type and a processor");

  std::lock_guard lock(mutex_);
  if (!processors_.emplace(operation_type, std::move(processor)).second) {
    throw util::AlreadyExists("processor already registered for " + operation_type);
  }
}

std::shared_ptr<JobProcessor> JobRunner::ProcessorFor(const std::string& operation_type) const {
  std::lock_guard lock(mutex_);
  auto            it = processors_.find(operation_type);
  if (it == processors_.end()) return nullptr;
  return it->second;
}

JobOutcome JobRunner::SubmitJob(int64_t ticket_id, const std::string& operation_type, const core::v1::MapValue& config) {
  observability::SpanScope span("JobRunner.SubmitJob");
  span.SetAttribute("jobguard.ticket_id", ticket_id);
  span.SetAttribute("jobguard.operation_type", operation_type);

  auto processor = ProcessorFor(operation_type);
  if (!processor) throw util::InvalidArgument("no processor registered for operation type " + operation_type);

  const auto key     = claim::ComputeIdempotencyKey(ticket_id, operation_type, config);
  const auto outcome = claims_->Claim(key, options_.worker_id, options_.claim_timeout);

  if (const auto* held = std::get_if<claim::HeldByOther>(&outcome)) {
    JobOutcome result;
    result.kind = JobOutcomeKind::kInProgress;
    if (held->job_id) {
      result.job_id = *held->job_id;
    } else if (auto existing = claims_->GetJobByKey(key.ToString())) {
      result.job_id = existing->id;
    }
    return result;
  }

  if (const auto* done = std::get_if<claim::AlreadyProcessed>(&outcome)) {
    JobOutcome result;
    result.kind       = JobOutcomeKind::kAlreadyProcessed;
    result.job_id     = done->job_id;
    result.result     = done->result;
    result.error      = done->error;
    result.from_cache = true;
    return result;
  }

  return Run(std::get<claim::Claimed>(outcome), key, config, *processor);
}

JobOutcome JobRunner::Run(const claim::Claimed& claimed, const claim::IdempotencyKey& key, const core::v1::MapValue& config, JobProcessor& processor) {
  JobOutcome outcome;
  outcome.job_id      = claimed.job_id;
  outcome.retry_count = claimed.retry_count;

  if (!claims_->Transition(claimed.job_id, JobStatus::kProcessing, {}, std::nullopt, options_.worker_id)) {
    outcome.kind  = JobOutcomeKind::kFailed;
    outcome.error = "job " + std::to_string(claimed.job_id) + " could not move to PROCESSING";
    return outcome;
  }

  const auto session_id = SessionIdForJob(claimed.job_id);

  ProcessResult processed;
  {
    SessionPersistenceGuard guard(*coordinator_, session_id);
    try {
      std::optional<recovery::RecoveryResult> recovered;
      if (claimed.reclaimed) {
        recovered = coordinator_->RecoverSession(session_id);
        JOBGUARD_LOG_INFO("Reclaimed job recovery", {observability::IntField("job_id", static_cast<int64_t>(claimed.job_id)),
                                                     observability::BoolField("recovered", recovered->success),
                                                     observability::StringField("target_id", recovered->target_id)});
      }

      automation::StepLog steps(repository_, session_id);
      JobContext          context(claimed.job_id, key, config, options_.worker_id, *claims_, *coordinator_, steps, std::move(recovered));
      processed = processor.Process(context);
    } catch (const std::exception& e) {
      processed         = ProcessResult{};
      processed.success = false;
      processed.error   = e.what();
      JOBGUARD_LOG_ERROR("Job run threw", {observability::IntField("job_id", static_cast<int64_t>(claimed.job_id)),
                                                 observability::StringField("error", processed.error)});
    }
  }

  if (!processed.success && processed.error.empty()) {
    processed.error = processed.requires_human_intervention ? "requires human intervention" : "processor reported failure";
  }

  const auto target = processed.success ? JobStatus::kCompleted : JobStatus::kFailed;
  if (!claims_->Transition(claimed.job_id, target, processed.success ? std::string{} : processed.error, processed.result, options_.worker_id)) {
    outcome.kind  = JobOutcomeKind::kFailed;
    outcome.error = "lost ownership of job " + std::to_string(claimed.job_id) + " before it finished";
    return outcome;
  }

  outcome.kind                        = processed.success ? JobOutcomeKind::kCompleted : JobOutcomeKind::kFailed;
  outcome.result                      = std::move(processed.result);
  outcome.error                       = std::move(processed.error);
  outcome.requires_human_intervention = processed.requires_human_intervention;
  return outcome;
}

} // namespace jobguard::job
