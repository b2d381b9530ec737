#include "internal/recovery/recovery_executor.hpp"

#include <chrono>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recovery/validation_rules.hpp"
#include "internal/state/value_builder.hpp"

namespace jobguard::recovery {

namespace {

constexpr int kAuditConflictAttempts = 8;

uint64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count());
}

} // namespace

RecoveryExecutor::RecoveryExecutor(std::shared_ptr<checkpoint::CheckpointStore> store, std::shared_ptr<db::Repository> repository, util::NowFn now)
    : store_(std::move(store)), repository_(std::move(repository)), now_(std::move(now)) {
  if (!store_ || !repository_) throw util::InvalidArgument("RecoveryExecutor requires a checkpoint store and a repository");
  if (!now_) now_ = util::Now;
}

RecoveredState RecoveryExecutor::Restore(const RecoveryPlan& plan) {
  RecoveredState state;
  state.kind           = plan.target_kind;
  state.recovered_from = plan.target_id;

  if (plan.target_kind == RecoveryPointKind::kCheckpoint) {
    auto checkpoint    = store_->Load(plan.target_id);
    state.session_id   = checkpoint.session_id();
    state.current_step = checkpoint.current_step();
    state.total_steps  = checkpoint.total_steps();
    state.checkpoint   = std::move(checkpoint);
    return state;
  }

  auto snapshot      = store_->LoadSnapshot(plan.target_id);
  state.session_id   = snapshot.session_id();
  state.current_step = state::GetInt(snapshot.automation_state(), "current_step");
  state.total_steps  = state::GetInt(snapshot.automation_state(), "total_steps");
  state.snapshot     = std::move(snapshot);
  return state;
}

RecoveryResult RecoveryExecutor::Execute(const RecoveryPlan& plan) {
  observability::SpanScope span("RecoveryExecutor.Execute");
  span.SetAttribute("jobguard.session_id", plan.session_id);
  span.SetAttribute("jobguard.recovery_id", plan.recovery_id);

  const auto start = std::chrono::steady_clock::now();

  if (AlreadyExecuted(plan)) throw util::AlreadyExists("recovery " + plan.recovery_id + " was already executed");

  RecoveryResult result;
  result.recovery_id = plan.recovery_id;
  result.session_id  = plan.session_id;
  result.target_id   = plan.target_id;
  result.strategy    = plan.strategy;

  if (plan.status != RecoveryStatus::kRecoverable) {
    result.error = "recovery not possible: " + std::string(ToString(plan.status));
    if (!plan.reason.empty()) result.error += " (" + plan.reason + ")";
  } else {
    try {
      auto state        = Restore(plan);
      result.validation = RunValidationRules(state, plan.session_id, plan.validation_rules);
      result.state      = std::move(state);
      result.success    = true;
    } catch (const util::IntegrityError& e) {
      result.error = std::string("target failed integrity check: ") + e.what();
    } catch (const util::NotFound& e) {
      result.error = std::string("target disappeared: ") + e.what();
    }
  }
  result.recovery_time_ms = ElapsedMs(start);

  Audit(plan, result);
  observability::Metrics::Instance().RecordRecovery(ToString(plan.status), result.success);

  if (result.success) {
    JOBGUARD_LOG_INFO("Recovery executed", {observability::StringField("session_id", plan.session_id),
                                            observability::StringField("recovery_id", plan.recovery_id),
                                            observability::StringField("target_id", plan.target_id),
                                            observability::BoolField("overall_valid", result.validation.overall_valid),
                                            observability::IntField("recovery_time_ms", static_cast<int64_t>(result.recovery_time_ms))});
  } else {
    span.RecordException(result.error);
    JOBGUARD_LOG_WARN("Recovery refused", {observability::StringField("session_id", plan.session_id),
                                           observability::StringField("recovery_id", plan.recovery_id),
                                           observability::StringField("error", result.error)});
  }
  return result;
}

bool RecoveryExecutor::AlreadyExecuted(const RecoveryPlan& plan) {
  auto tx = repository_->Begin();
  for (const auto& record : repository_->ListRecoveries(*tx, plan.session_id)) {
    if (record.recovery_id == plan.recovery_id) return true;
  }
  return false;
}

void RecoveryExecutor::Audit(const RecoveryPlan& plan, const RecoveryResult& result) {
  db::model::RecoveryRecord record;
  record.recovery_id       = plan.recovery_id;
  record.session_id        = plan.session_id;
  record.target_id         = plan.target_id;
  record.strategy          = plan.strategy;
  record.status            = static_cast<uint8_t>(plan.status);
  record.confidence        = plan.confidence;
  record.integrity_score   = plan.integrity_score;
  record.estimated_seconds = plan.estimated_seconds;
  record.success           = result.success;
  record.error             = result.error;
  record.recovery_time_ms  = result.recovery_time_ms;
  record.created_at_ms     = util::ToUnixMillis(now_());

  db::RetryOnConflict(kAuditConflictAttempts, [&] {
    auto tx  = repository_->Begin();
    auto res = repository_->InsertRecovery(*tx, record);
    if (res.code == db::ErrorCode::AlreadyExists) throw util::AlreadyExists("recovery " + plan.recovery_id + " was already executed");
    db::ThrowIfConflict(res);
    if (!res) throw std::runtime_error("insert recovery audit row: " + res.message);
    tx->Commit();
  });
}

} // namespace jobguard::recovery
