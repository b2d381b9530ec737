#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/automation/step_log.hpp"
#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/claim/claim_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/persistence/persistence_coordinator.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/state/value_builder.hpp"
#include "internal/util/uuid.hpp"
#include "jobguard/v1.hpp"

namespace {

using namespace jobguard::v1;

struct Harness {
  Harness()
      : dir(std::filesystem::temp_directory_path() / "jobguard_grpc_status_tests" / jobguard::util::PrefixedId("run_")),
        repo(std::make_shared<jobguard::db::memory::MemoryRepository>()) {
    ctx.repository  = repo;
    ctx.checkpoints = std::make_shared<jobguard::checkpoint::CheckpointStore>(repo, std::make_shared<jobguard::checkpoint::CheckpointFiles>(dir.string(), false));
    ctx.claims      = std::make_shared<jobguard::claim::ClaimStore>(repo, std::make_shared<jobguard::claim::LocalLockTable>());
    ctx.coordinator = std::make_shared<jobguard::persistence::PersistenceCoordinator>(
        ctx.checkpoints, std::make_shared<jobguard::recovery::RecoveryPlanner>(ctx.checkpoints),
        std::make_shared<jobguard::recovery::RecoveryExecutor>(ctx.checkpoints, repo));
    server = std::make_unique<jobguard::grpc::AdminServer>(std::make_shared<jobguard::service::AdminService>(ctx));
  }

  uint64_t ClaimJob(int64_t ticket_id) {
    const auto key = jobguard::claim::ComputeIdempotencyKey(ticket_id, "invoice_portal", jobguard::state::MapOf({{"url", jobguard::state::MakeString("https://x")}}));
    return std::get<jobguard::claim::Claimed>(ctx.claims->Claim(key, "worker-a", std::chrono::seconds(300))).job_id;
  }

  std::filesystem::path                                    dir;
  std::shared_ptr<jobguard::db::memory::MemoryRepository> repo;
  jobguard::service::ServiceContext                        ctx;
  std::unique_ptr<jobguard::grpc::AdminServer>             server;
};

void TestExceptionMapping() {
  using namespace jobguard::util;

  assert(jobguard::grpc::ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(jobguard::grpc::ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(jobguard::grpc::ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(jobguard::grpc::ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(jobguard::grpc::ToStatus(CodecError("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(jobguard::grpc::ToStatus(TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(jobguard::grpc::ToStatus(IntegrityError(IntegrityError::Kind::kChecksumMismatch, "x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(jobguard::grpc::ToStatus(StorageError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);

  const auto internal = jobguard::grpc::ToStatus(std::runtime_error("disk on fire"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "disk on fire");
}

void TestGetJobStatuses() {
  Harness               h;
  ::grpc::ServerContext grpc_ctx;

  GetJobRequest  unset;
  GetJobResponse resp;
  assert(h.server->GetJob(&grpc_ctx, &unset, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  GetJobRequest missing;
  missing.set_job_id(404);
  assert(h.server->GetJob(&grpc_ctx, &missing, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  const auto job_id = h.ClaimJob(42);

  GetJobRequest by_id;
  by_id.set_job_id(job_id);
  assert(h.server->GetJob(&grpc_ctx, &by_id, &resp).ok());
  assert(resp.job().status() == JOB_STATUS_CLAIMED);
  assert(resp.job().claimed_by() == "worker-a");
  assert(resp.job().ticket_id() == 42);

  GetJobRequest by_key;
  by_key.set_idempotency_key(resp.job().idempotency_key());
  GetJobResponse keyed;
  assert(h.server->GetJob(&grpc_ctx, &by_key, &keyed).ok());
  assert(keyed.job().job_id() == job_id);
}

void TestCancelJob() {
  Harness               h;
  ::grpc::ServerContext grpc_ctx;
  const auto            job_id = h.ClaimJob(7);

  CancelJobRequest req;
  req.set_job_id(job_id);
  CancelJobResponse resp;
  assert(h.server->CancelJob(&grpc_ctx, &req, &resp).ok());
  assert(resp.cancelled());
  assert(resp.status() == JOB_STATUS_CANCELLED);

  // Cancelling twice is refused by the state machine, not an error.
  CancelJobResponse again;
  assert(h.server->CancelJob(&grpc_ctx, &req, &again).ok());
  assert(!again.cancelled());

  CancelJobRequest unknown;
  unknown.set_job_id(9999);
  assert(h.server->CancelJob(&grpc_ctx, &unknown, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  CancelJobRequest empty;
  assert(h.server->CancelJob(&grpc_ctx, &empty, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestValidateAndRecoveryInfo() {
  Harness               h;
  ::grpc::ServerContext grpc_ctx;

  jobguard::core::v1::Checkpoint checkpoint;
  checkpoint.set_session_id("session-admin");
  checkpoint.set_automation_type("invoice_portal");
  checkpoint.set_current_step(3);
  checkpoint.set_total_steps(5);
  *checkpoint.mutable_state_data()        = jobguard::state::MapOf({{"page", jobguard::state::MakeString("list")}});
  *checkpoint.mutable_execution_context() = jobguard::state::MapOf({{"url", jobguard::state::MakeString("https://x")}});
  const auto saved                        = h.ctx.coordinator->CreateCheckpoint(checkpoint);

  ValidateCheckpointRequest validate;
  validate.set_checkpoint_id(saved.checkpoint_id());
  ValidateCheckpointResponse report;
  assert(h.server->ValidateCheckpoint(&grpc_ctx, &validate, &report).ok());
  assert(report.report().valid());
  assert(report.report().integrity_score() == 1.0);

  validate.set_checkpoint_id("chk_missing");
  assert(h.server->ValidateCheckpoint(&grpc_ctx, &validate, &report).ok());
  assert(!report.report().valid());
  assert(report.report().integrity_score() == 0.0);

  GetSessionRecoveryInfoRequest info_req;
  info_req.set_session_id("session-admin");
  GetSessionRecoveryInfoResponse info;
  assert(h.server->GetSessionRecoveryInfo(&grpc_ctx, &info_req, &info).ok());
  assert(info.recovery_points_size() == 1);
  assert(info.plan().status() == RECOVERY_STATUS_RECOVERABLE);
  assert(info.plan().target_id() == saved.checkpoint_id());
  assert(info.recommendation().action() == "immediate_recovery");

  GetSessionRecoveryInfoRequest no_session;
  assert(h.server->GetSessionRecoveryInfo(&grpc_ctx, &no_session, &info).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestListSteps() {
  Harness               h;
  ::grpc::ServerContext grpc_ctx;

  jobguard::automation::StepLog log(h.repo, "session-steps");
  jobguard::db::model::StepRecord step;
  step.route         = "primary";
  step.action_type   = jobguard::model::ActionType::kClick;
  step.selector      = "#download";
  step.result_status = jobguard::model::StepStatus::kFailed;
  step.timing_ms     = 40;
  log.Append(step);
  step.route         = "fallback";
  step.result_status = jobguard::model::StepStatus::kSuccess;
  step.retry_used    = true;
  step.timing_ms     = 60;
  log.Append(step);

  ListStepsRequest req;
  req.set_session_id("session-steps");
  ListStepsResponse resp;
  assert(h.server->ListSteps(&grpc_ctx, &req, &resp).ok());
  assert(resp.steps_size() == 2);
  assert(resp.steps(0).step_number() == 1);
  assert(resp.steps(0).action_type() == "click");
  assert(resp.steps(1).route() == "fallback");
  assert(resp.steps(1).result_status() == STEP_RESULT_STATUS_SUCCESS);
  assert(resp.attempts() == 2);
  assert(resp.successes() == 1);
  assert(resp.success_rate() == 0.5);
  assert(resp.total_time_ms() == 100);
}

void TestCleanupRpcs() {
  Harness               h;
  ::grpc::ServerContext grpc_ctx;
  h.ClaimJob(1);

  // A fresh claim is never stale.
  CleanupStaleJobsRequest stale_req;
  stale_req.set_retention_hours(1);
  CleanupStaleJobsResponse stale;
  assert(h.server->CleanupStaleJobs(&grpc_ctx, &stale_req, &stale).ok());
  assert(stale.timed_out() == 0);

  CleanupCheckpointsRequest cleanup_req;
  CleanupCheckpointsResponse cleanup;
  assert(h.server->CleanupCheckpoints(&grpc_ctx, &cleanup_req, &cleanup).ok());
  assert(cleanup.checkpoints_deleted() == 0);
  assert(cleanup.snapshots_deleted() == 0);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestGetJobStatuses();
  TestCancelJob();
  TestValidateAndRecoveryInfo();
  TestListSteps();
  TestCleanupRpcs();
  std::cout << "jobguard_unit_grpc_status: pass\n";
  return 0;
}
