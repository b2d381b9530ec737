#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/automation/fallback_router.hpp"
#include "internal/checkpoint/checkpoint_store.hpp"
#include "internal/claim/claim_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/job/job_runner.hpp"
#include "internal/maintenance/maintenance_worker.hpp"
#include "internal/persistence/persistence_coordinator.hpp"

namespace jobguard::factory {

/*
  Application

  Owns all long-lived components used by the server. Everything here
  lives for the lifetime of the process. The composition root is the
  only place allowed to know concrete repository types.
*/
struct Application {
  std::shared_ptr<db::Repository>                      repository;
  std::shared_ptr<claim::ClaimStore>                   claims;
  std::shared_ptr<checkpoint::CheckpointStore>         checkpoints;
  std::shared_ptr<persistence::PersistenceCoordinator> coordinator;
  std::shared_ptr<job::JobRunner>                      job_runner;

  // Handed to processors that build their own FallbackRouter.
  automation::FallbackRouterOptions router_options;

  std::vector<std::unique_ptr<::grpc::Service>>                  grpc_services;
  std::vector<std::shared_ptr<maintenance::MaintenanceWorker>> background_workers;
};

std::shared_ptr<db::Repository> BuildRepository(const jobguard::runtime::config::RuntimeConfig& config);

Application Build(const jobguard::runtime::config::RuntimeConfig& config);

} // namespace jobguard::factory
