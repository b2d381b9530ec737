#pragma once

#include "jobguard/services/v1/job_admin_service.pb.h"
#include "service_context.hpp"

namespace jobguard::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  jobguard::admin::v1::GetJobResponse GetJob(const jobguard::admin::v1::GetJobRequest& req);

  jobguard::admin::v1::CancelJobResponse CancelJob(const jobguard::admin::v1::CancelJobRequest& req);

  jobguard::admin::v1::CleanupStaleJobsResponse CleanupStaleJobs(const jobguard::admin::v1::CleanupStaleJobsRequest& req);

  jobguard::admin::v1::GetSessionRecoveryInfoResponse GetSessionRecoveryInfo(const jobguard::admin::v1::GetSessionRecoveryInfoRequest& req);

  jobguard::admin::v1::ValidateCheckpointResponse ValidateCheckpoint(const jobguard::admin::v1::ValidateCheckpointRequest& req);

  jobguard::admin::v1::CleanupCheckpointsResponse CleanupCheckpoints(const jobguard::admin::v1::CleanupCheckpointsRequest& req);

  jobguard::admin::v1::ListStepsResponse ListSteps(const jobguard::admin::v1::ListStepsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace jobguard::service
