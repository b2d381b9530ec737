#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "jobguard/v1.hpp"

using namespace jobguard::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  jobguardctl <addr> job <job_id>\n"
            << "  jobguardctl <addr> job-by-key <idempotency_key>\n"
            << "  jobguardctl <addr> cancel <job_id> [reason]\n"
            << "  jobguardctl <addr> cleanup-stale [retention_hours]\n"
            << "  jobguardctl <addr> recovery <session_id>\n"
            << "  jobguardctl <addr> validate <checkpoint_id>\n"
            << "  jobguardctl <addr> cleanup-checkpoints [retention_days]\n"
            << "  jobguardctl <addr> steps <session_id>\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

static void PrintJob(const JobInfo& job) {
  std::cout << "job_id=" << job.job_id() << "\n";
  std::cout << "key=" << job.idempotency_key() << "\n";
  std::cout << "ticket_id=" << job.ticket_id() << "\n";
  std::cout << "operation=" << job.operation_type() << "\n";
  std::cout << "status=" << JobStatus_Name(job.status()) << "\n";
  std::cout << "claimed_by=" << job.claimed_by() << "\n";
  std::cout << "retry_count=" << job.retry_count() << "\n";
  if (!job.error_message().empty()) std::cout << "error=" << job.error_message() << "\n";
}

static void PrintPoint(const RecoveryPointInfo& point) {
  std::cout << "  " << point.point_id() << " kind=" << RecoveryPointKind_Name(point.kind()) << " step=" << point.current_step() << "/"
            << point.total_steps() << " bytes=" << point.data_size_bytes() << " confidence=" << point.confidence() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = JobAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "job" || cmd == "job-by-key") {
    if (argc < 4) return 1;

    GetJobRequest req;
    if (cmd == "job") {
      req.set_job_id(std::stoull(argv[3]));
    } else {
      req.set_idempotency_key(argv[3]);
    }

    GetJobResponse resp;

    auto status = stub->GetJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintJob(resp.job());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelJobRequest req;
    req.set_job_id(std::stoull(argv[3]));
    if (argc >= 5) req.set_reason(argv[4]);

    CancelJobResponse resp;

    auto status = stub->CancelJob(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << (resp.cancelled() ? "cancelled" : "not cancelled") << " status=" << JobStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup-stale") {
    CleanupStaleJobsRequest req;
    if (argc >= 4) req.set_retention_hours(static_cast<uint32_t>(std::stoul(argv[3])));

    CleanupStaleJobsResponse resp;

    auto status = stub->CleanupStaleJobs(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "timed_out=" << resp.timed_out() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "recovery") {
    if (argc < 4) return 1;

    GetSessionRecoveryInfoRequest req;
    req.set_session_id(argv[3]);

    GetSessionRecoveryInfoResponse resp;

    auto status = stub->GetSessionRecoveryInfo(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "session=" << resp.session_id() << "\n";
    std::cout << "points:\n";
    for (const auto& point : resp.recovery_points()) PrintPoint(point);

    const auto& plan = resp.plan();
    std::cout << "plan=" << plan.recovery_id() << " status=" << RecoveryStatus_Name(plan.status()) << " target=" << plan.target_id()
              << " strategy=" << plan.strategy() << " confidence=" << plan.recovery_confidence() << " eta_s=" << plan.estimated_recovery_seconds()
              << "\n";
    std::cout << "recommendation=" << resp.recommendation().action() << " (" << resp.recommendation().message() << ")\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "validate") {
    if (argc < 4) return 1;

    ValidateCheckpointRequest req;
    req.set_checkpoint_id(argv[3]);

    ValidateCheckpointResponse resp;

    auto status = stub->ValidateCheckpoint(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "valid=" << (resp.report().valid() ? "true" : "false") << " score=" << resp.report().integrity_score();
    if (!resp.report().reason().empty()) std::cout << " reason=" << resp.report().reason();
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup-checkpoints") {
    CleanupCheckpointsRequest req;
    if (argc >= 4) req.set_retention_days(static_cast<uint32_t>(std::stoul(argv[3])));

    CleanupCheckpointsResponse resp;

    auto status = stub->CleanupCheckpoints(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "checkpoints_deleted=" << resp.checkpoints_deleted() << "\n";
    std::cout << "snapshots_deleted=" << resp.snapshots_deleted() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "steps") {
    if (argc < 4) return 1;

    ListStepsRequest req;
    req.set_session_id(argv[3]);

    ListStepsResponse resp;

    auto status = stub->ListSteps(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& step : resp.steps()) {
      std::cout << step.step_number() << " " << step.route() << " " << step.action_type() << " " << step.selector() << " "
                << StepResultStatus_Name(step.result_status()) << " " << step.timing_ms() << "ms" << (step.retry_used() ? " retry" : "") << "\n";
    }
    std::cout << "attempts=" << resp.attempts() << " successes=" << resp.successes() << " success_rate=" << resp.success_rate()
              << " total_time_ms=" << resp.total_time_ms() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
