#include "internal/persistence/persistence_coordinator.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::persistence {

using recovery::RecoveryStatus;

PersistenceCoordinator::PersistenceCoordinator(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<recovery::RecoveryPlanner> planner,
                                               std::shared_ptr<recovery::RecoveryExecutor> executor, PersistenceOptions options)
    : store_(std::move(store)), planner_(std::move(planner)), executor_(std::move(executor)), options_(options) {
  if (!store_ || !planner_ || !executor_) {
    throw util::InvalidArgument("PersistenceCoordinator requires a checkpoint store, planner and executor");
  }
  if (options_.auto_checkpoint_interval.count() <= 0) options_.auto_checkpoint_interval = std::chrono::seconds(300);
}

PersistenceCoordinator::~PersistenceCoordinator() {
  StopAll();
}

void PersistenceCoordinator::StartSessionPersistence(const std::string& session_id, const std::string& automation_type, ProgressSource source,
                                                     std::chrono::seconds interval) {
  if (session_id.empty()) throw util::InvalidArgument("session id must not be empty");
  if (!source) throw util::InvalidArgument("auto-checkpointing requires a progress source");
  if (interval.count() <= 0) interval = options_.auto_checkpoint_interval;

  std::lock_guard lock(mutex_);
  if (sessions_.contains(session_id)) throw util::AlreadyExists("session " + session_id + " is already persisting");

  SessionLoop loop;
  loop.stop   = std::make_shared<util::StopToken>();
  loop.thread = std::thread(&PersistenceCoordinator::RunLoop, store_, loop.stop, session_id, automation_type, std::move(source), interval);
  sessions_.emplace(session_id, std::move(loop));

  JOBGUARD_LOG_INFO("Session persistence started", {observability::StringField("session_id", session_id),
                                                    observability::StringField("automation_type", automation_type),
                                                    observability::IntField("interval_seconds", interval.count())});
}

bool PersistenceCoordinator::StopSessionPersistence(const std::string& session_id) {
  SessionLoop loop;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    loop = std::move(it->second);
    sessions_.erase(it);
  }

  // Join outside the lock; the loop may be in the middle of a save.
  loop.stop->RequestStop();
  if (loop.thread.joinable()) loop.thread.join();

  JOBGUARD_LOG_INFO("Session persistence stopped", {observability::StringField("session_id", session_id)});
  return true;
}

void PersistenceCoordinator::StopAll() {
  std::map<std::string, SessionLoop> sessions;
  {
    std::lock_guard lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [_, loop] : sessions) {
    loop.stop->RequestStop();
  }
  for (auto& [_, loop] : sessions) {
    if (loop.thread.joinable()) loop.thread.join();
  }
}

bool PersistenceCoordinator::IsPersisting(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  return sessions_.contains(session_id);
}

void PersistenceCoordinator::RunLoop(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<util::StopToken> stop, std::string session_id,
                                     std::string automation_type, ProgressSource source, std::chrono::seconds interval) {
  while (stop->WaitFor(interval)) {
    try {
      auto progress = source();
      if (!progress) continue;

      progress->set_session_id(session_id);
      if (progress->automation_type().empty()) progress->set_automation_type(automation_type);

      auto saved = store->Save(std::move(*progress));
      JOBGUARD_LOG_DEBUG("Auto-checkpoint created", {observability::StringField("session_id", session_id),
                                                     observability::StringField("checkpoint_id", saved.checkpoint_id()),
                                                     observability::IntField("current_step", saved.current_step())});
    } catch (const std::exception& e) {
      JOBGUARD_LOG_WARN("Auto-checkpoint failed", {observability::StringField("session_id", session_id),
                                                   observability::StringField("error", e.what())});
    }
  }
}

core::v1::Checkpoint PersistenceCoordinator::CreateCheckpoint(core::v1::Checkpoint checkpoint) {
  return store_->Save(std::move(checkpoint));
}

core::v1::SessionSnapshot PersistenceCoordinator::CreateSnapshot(core::v1::SessionSnapshot snapshot) {
  return store_->SaveSnapshot(std::move(snapshot));
}

recovery::RecoveryResult PersistenceCoordinator::RecoverSession(const std::string& session_id, const std::optional<std::string>& target_id) {
  observability::SpanScope span("PersistenceCoordinator.RecoverSession");
  span.SetAttribute("jobguard.session_id", session_id);

  auto plan = planner_->Plan(session_id, target_id);
  return executor_->Execute(plan);
}

SessionRecoveryInfo PersistenceCoordinator::GetSessionRecoveryInfo(const std::string& session_id) {
  SessionRecoveryInfo info;
  info.session_id      = session_id;
  info.plan            = planner_->Plan(session_id);
  info.recovery_points = info.plan.recovery_points;
  info.recommendation  = Recommend(info.plan);
  return info;
}

RecoveryRecommendation PersistenceCoordinator::Recommend(const recovery::RecoveryPlan& plan) {
  // Only a usable target may earn more than manual intervention.
  double confidence = 0.0;
  if (plan.status == RecoveryStatus::kRecoverable) {
    confidence = plan.confidence;
  } else if (plan.status == RecoveryStatus::kPartial) {
    confidence = std::min(plan.confidence, 0.7);
  }

  if (confidence >= 0.9) {
    return {"immediate_recovery", confidence, "High confidence recovery available"};
  }
  if (confidence >= 0.7) {
    return {"recovery_with_validation", confidence, "Recovery possible with additional validation"};
  }
  return {"manual_intervention", confidence, "Manual intervention may be required"};
}

} // namespace jobguard::persistence
