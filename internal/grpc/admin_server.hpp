#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "jobguard/services/v1/job_admin_service.grpc.pb.h"

namespace jobguard::grpc {

class AdminServer final : public jobguard::services::v1::JobAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<jobguard::service::AdminService> svc);

  ::grpc::Status GetJob(::grpc::ServerContext*, const jobguard::admin::v1::GetJobRequest*, jobguard::admin::v1::GetJobResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*, const jobguard::admin::v1::CancelJobRequest*, jobguard::admin::v1::CancelJobResponse*) override;

  ::grpc::Status CleanupStaleJobs(::grpc::ServerContext*, const jobguard::admin::v1::CleanupStaleJobsRequest*,
                                  jobguard::admin::v1::CleanupStaleJobsResponse*) override;

  ::grpc::Status GetSessionRecoveryInfo(::grpc::ServerContext*, const jobguard::admin::v1::GetSessionRecoveryInfoRequest*,
                                        jobguard::admin::v1::GetSessionRecoveryInfoResponse*) override;

  ::grpc::Status ValidateCheckpoint(::grpc::ServerContext*, const jobguard::admin::v1::ValidateCheckpointRequest*,
                                    jobguard::admin::v1::ValidateCheckpointResponse*) override;

  ::grpc::Status CleanupCheckpoints(::grpc::ServerContext*, const jobguard::admin::v1::CleanupCheckpointsRequest*,
                                    jobguard::admin::v1::CleanupCheckpointsResponse*) override;

  ::grpc::Status ListSteps(::grpc::ServerContext*, const jobguard::admin::v1::ListStepsRequest*, jobguard::admin::v1::ListStepsResponse*) override;

 private:
  std::shared_ptr<jobguard::service::AdminService> service_;
};

} // namespace jobguard::grpc
