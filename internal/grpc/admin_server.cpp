#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "jobguard/v1.hpp"

namespace jobguard::grpc {

using namespace jobguard::v1;

namespace {

template <typename Fn>
::grpc::Status Call(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<jobguard::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetJob(::grpc::ServerContext*, const GetJobRequest* req, GetJobResponse* resp) {
  return Call([&] { *resp = service_->GetJob(*req); });
}

::grpc::Status AdminServer::CancelJob(::grpc::ServerContext*, const CancelJobRequest* req, CancelJobResponse* resp) {
  return Call([&] { *resp = service_->CancelJob(*req); });
}

::grpc::Status AdminServer::CleanupStaleJobs(::grpc::ServerContext*, const CleanupStaleJobsRequest* req, CleanupStaleJobsResponse* resp) {
  return Call([&] { *resp = service_->CleanupStaleJobs(*req); });
}

::grpc::Status AdminServer::GetSessionRecoveryInfo(::grpc::ServerContext*, const GetSessionRecoveryInfoRequest* req,
                                                   GetSessionRecoveryInfoResponse* resp) {
  return Call([&] { *resp = service_->GetSessionRecoveryInfo(*req); });
}

::grpc::Status AdminServer::ValidateCheckpoint(::grpc::ServerContext*, const ValidateCheckpointRequest* req, ValidateCheckpointResponse* resp) {
  return Call([&] { *resp = service_->ValidateCheckpoint(*req); });
}

::grpc::Status AdminServer::CleanupCheckpoints(::grpc::ServerContext*, const CleanupCheckpointsRequest* req, CleanupCheckpointsResponse* resp) {
  return Call([&] { *resp = service_->CleanupCheckpoints(*req); });
}

::grpc::Status AdminServer::ListSteps(::grpc::ServerContext*, const ListStepsRequest* req, ListStepsResponse* resp) {
  return Call([&] { *resp = service_->ListSteps(*req); });
}

} // namespace jobguard::grpc
