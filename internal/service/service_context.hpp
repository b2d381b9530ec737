#pragma once

#include <chrono>
#include <memory>

namespace jobguard::claim {
class ClaimStore;
}
namespace jobguard::checkpoint {
class CheckpointStore;
}
namespace jobguard::persistence {
class PersistenceCoordinator;
}
namespace jobguard::db {
class Repository;
}

namespace jobguard::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<jobguard::claim::ClaimStore>                   claims;
  std::shared_ptr<jobguard::checkpoint::CheckpointStore>         checkpoints;
  std::shared_ptr<jobguard::persistence::PersistenceCoordinator> coordinator;
  std::shared_ptr<jobguard::db::Repository>                      repository;

  // Used when a request leaves its retention window at zero.
  std::chrono::hours stale_after{24};
  std::chrono::hours checkpoint_retention{24 * 30};
};

} // namespace jobguard::service
