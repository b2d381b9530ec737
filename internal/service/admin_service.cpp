#include "admin_service.hpp"

#include <chrono>

#include "internal/automation/step_log.hpp"
#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/claim/claim_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/persistence/persistence_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "jobguard/v1.hpp"

namespace jobguard::service {

using namespace jobguard::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

/*
  Span, request metrics and error logging around one RPC body. Errors
  are rethrown for the transport layer to map.
*/
template <typename Fn>
auto Instrumented(std::string_view route, Fn&& fn) -> decltype(fn()) {
  jobguard::observability::SpanScope span(route);
  const auto                         started_at = std::chrono::steady_clock::now();

  try {
    auto resp = fn();
    jobguard::observability::Metrics::Instance().RecordRequest(route, true);
    jobguard::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    JOBGUARD_LOG_ERROR("RPC failed", {jobguard::observability::StringField("route", route), jobguard::observability::StringField("error", ex.what())});
    jobguard::observability::Metrics::Instance().RecordRequest(route, false);
    jobguard::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void FillJobInfo(const db::model::JobRecord& record, JobInfo* info) {
  info->set_job_id(record.id);
  info->set_idempotency_key(record.idempotency_key);
  info->set_ticket_id(record.ticket_id);
  info->set_operation_type(record.operation_type);
  info->set_status(static_cast<JobStatus>(record.status));
  info->set_claimed_by(record.claimed_by);
  if (record.claimed_at_ms > 0) *info->mutable_claimed_at() = util::MillisToProto(record.claimed_at_ms);
  if (record.completed_at_ms) *info->mutable_completed_at() = util::MillisToProto(*record.completed_at_ms);
  if (auto result = claim::ClaimStore::DecodeResult(record)) *info->mutable_result() = std::move(*result);
  info->set_error_message(record.error_message);
  info->set_retry_count(record.retry_count);
}

void FillPoint(const recovery::RecoveryPoint& point, RecoveryPointInfo* info) {
  info->set_point_id(point.id);
  info->set_kind(static_cast<RecoveryPointKind>(point.kind));
  info->set_current_step(point.current_step.value_or(0));
  info->set_total_steps(point.total_steps.value_or(0));
  *info->mutable_created_at() = util::MillisToProto(point.created_at_ms);
  info->set_data_size_bytes(point.data_size_bytes);
  info->set_confidence(point.confidence);
}

void FillPlan(const recovery::RecoveryPlan& plan, RecoveryPlanInfo* info) {
  info->set_recovery_id(plan.recovery_id);
  info->set_session_id(plan.session_id);
  info->set_target_id(plan.target_id);
  info->set_strategy(plan.strategy);
  info->set_status(static_cast<RecoveryStatus>(plan.status));
  info->set_recovery_confidence(plan.confidence);
  info->set_data_integrity_score(plan.integrity_score);
  info->set_estimated_recovery_seconds(plan.estimated_seconds);
  for (const auto& option : plan.recovery_options) {
    FillPoint(option, info->add_recovery_options());
  }
  for (const auto& rule : plan.validation_rules) {
    info->add_validation_rules(rule.id);
  }
}

void FillStep(const db::model::StepRecord& step, StepInfo* info) {
  info->set_step_number(step.step_number);
  info->set_route(step.route);
  info->set_action_type(std::string(jobguard::model::ToString(step.action_type)));
  info->set_selector(step.selector);
  info->set_result_status(static_cast<StepResultStatus>(step.result_status));
  info->set_timing_ms(step.timing_ms);
  info->set_retry_used(step.retry_used);
  info->set_reasoning(step.reasoning);
  info->set_evidence_ref(step.evidence_ref);
  *info->mutable_created_at() = util::MillisToProto(step.created_at_ms);
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.claims || !ctx_.checkpoints || !ctx_.coordinator || !ctx_.repository) {
    throw util::InvalidArgument("AdminService requires claims, checkpoints, coordinator and repository");
  }
}

GetJobResponse AdminService::GetJob(const GetJobRequest& req) {
  return Instrumented("AdminService.GetJob", [&] {
    std::optional<db::model::JobRecord> record;
    switch (req.lookup_case()) {
      case GetJobRequest::kJobId:
        record = ctx_.claims->GetJob(req.job_id());
        break;
      case GetJobRequest::kIdempotencyKey:
        record = ctx_.claims->GetJobByKey(req.idempotency_key());
        break;
      case GetJobRequest::LOOKUP_NOT_SET:
        throw util::InvalidArgument("job_id or idempotency_key is required");
    }
    if (!record) throw util::NotFound("job not found");

    GetJobResponse resp;
    FillJobInfo(*record, resp.mutable_job());
    return resp;
  });
}

CancelJobResponse AdminService::CancelJob(const CancelJobRequest& req) {
  return Instrumented("AdminService.CancelJob", [&] {
    if (req.job_id() == 0) throw util::InvalidArgument("job_id is required");

    const auto reason    = req.reason().empty() ? std::string("cancelled by operator") : req.reason();
    const bool cancelled = ctx_.claims->Transition(req.job_id(), jobguard::model::JobStatus::kCancelled, reason);

    auto record = ctx_.claims->GetJob(req.job_id());
    if (!record) throw util::NotFound("job " + std::to_string(req.job_id()) + " not found");

    CancelJobResponse resp;
    resp.set_cancelled(cancelled);
    resp.set_status(static_cast<JobStatus>(record->status));
    return resp;
  });
}

CleanupStaleJobsResponse AdminService::CleanupStaleJobs(const CleanupStaleJobsRequest& req) {
  return Instrumented("AdminService.CleanupStaleJobs", [&] {
    const auto retention = req.retention_hours() > 0 ? std::chrono::hours(req.retention_hours()) : ctx_.stale_after;

    CleanupStaleJobsResponse resp;
    resp.set_timed_out(ctx_.claims->CleanupStale(retention));
    return resp;
  });
}

GetSessionRecoveryInfoResponse AdminService::GetSessionRecoveryInfo(const GetSessionRecoveryInfoRequest& req) {
  return Instrumented("AdminService.GetSessionRecoveryInfo", [&] {
    if (req.session_id().empty()) throw util::InvalidArgument("session_id is required");

    const auto info = ctx_.coordinator->GetSessionRecoveryInfo(req.session_id());

    GetSessionRecoveryInfoResponse resp;
    resp.set_session_id(info.session_id);
    for (const auto& point : info.recovery_points) {
      FillPoint(point, resp.add_recovery_points());
    }
    FillPlan(info.plan, resp.mutable_plan());

    auto* recommendation = resp.mutable_recommendation();
    recommendation->set_action(info.recommendation.action);
    recommendation->set_confidence(info.recommendation.confidence);
    recommendation->set_message(info.recommendation.message);
    return resp;
  });
}

ValidateCheckpointResponse AdminService::ValidateCheckpoint(const ValidateCheckpointRequest& req) {
  return Instrumented("AdminService.ValidateCheckpoint", [&] {
    if (req.checkpoint_id().empty()) throw util::InvalidArgument("checkpoint_id is required");

    const auto report = ctx_.checkpoints->ValidateIntegrity(req.checkpoint_id());

    ValidateCheckpointResponse resp;
    resp.mutable_report()->set_valid(report.valid);
    resp.mutable_report()->set_integrity_score(report.integrity_score);
    resp.mutable_report()->set_reason(report.reason);
    return resp;
  });
}

CleanupCheckpointsResponse AdminService::CleanupCheckpoints(const CleanupCheckpointsRequest& req) {
  return Instrumented("AdminService.CleanupCheckpoints", [&] {
    const auto retention = req.retention_days() > 0 ? std::chrono::hours(24 * req.retention_days()) : ctx_.checkpoint_retention;
    const auto cleaned   = ctx_.checkpoints->CleanupOlderThan(retention);

    CleanupCheckpointsResponse resp;
    resp.set_checkpoints_deleted(cleaned.checkpoints_deleted);
    resp.set_snapshots_deleted(cleaned.snapshots_deleted);
    return resp;
  });
}

ListStepsResponse AdminService::ListSteps(const ListStepsRequest& req) {
  return Instrumented("AdminService.ListSteps", [&] {
    if (req.session_id().empty()) throw util::InvalidArgument("session_id is required");

    auto tx    = ctx_.repository->Begin();
    auto steps = ctx_.repository->ListSteps(*tx, req.session_id());
    tx->Commit();

    const auto summary = automation::Summarize(steps);

    ListStepsResponse resp;
    for (const auto& step : steps) {
      FillStep(step, resp.add_steps());
    }
    resp.set_attempts(summary.attempts);
    resp.set_successes(summary.successes);
    resp.set_success_rate(summary.success_rate);
    resp.set_total_time_ms(summary.total_time_ms);
    return resp;
  });
}

} // namespace jobguard::service
