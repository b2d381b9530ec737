#include "internal/recovery/recovery_planner.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recovery/validation_rules.hpp"
#include "internal/util/uuid.hpp"

namespace jobguard::recovery {

namespace {

constexpr uint64_t kBytesPerMb     = 1024 * 1024;
constexpr uint64_t kLargePayloadMb = 10;
constexpr uint32_t kSecondsPerMb   = 2;
constexpr uint64_t kMillisPerDay   = 24ULL * 60 * 60 * 1000;

// Higher confidence first, then newer.
bool Preferred(const RecoveryPoint& a, const RecoveryPoint& b) {
  if (a.confidence != b.confidence) return a.confidence > b.confidence;
  return a.created_at_ms > b.created_at_ms;
}

RecoveryPlan EmptyPlan(const std::string& session_id, std::vector<RecoveryPoint> points, std::string reason) {
  RecoveryPlan plan;
  plan.recovery_id      = util::PrefixedId("rec_");
  plan.session_id       = session_id;
  plan.recovery_points  = std::move(points);
  plan.status           = RecoveryStatus::kMissing;
  plan.validation_rules = DefaultValidationRules();
  plan.reason           = std::move(reason);
  return plan;
}

} // namespace

std::string_view StrategyFor(const RecoveryPoint& point) {
  if (point.kind == RecoveryPointKind::kSnapshot) return kSnapshotRecovery;
  return point.confidence >= 0.9 ? kDirectCheckpointRecovery : kCheckpointWithValidation;
}

uint32_t EstimateRecoverySeconds(std::string_view strategy, uint64_t data_size_bytes) {
  uint32_t seconds = 60;
  if (strategy == kDirectCheckpointRecovery) {
    seconds = 30;
  } else if (strategy == kSnapshotRecovery) {
    seconds = 120;
  }

  const double size_mb = static_cast<double>(data_size_bytes) / static_cast<double>(kBytesPerMb);
  if (size_mb > static_cast<double>(kLargePayloadMb)) {
    seconds += static_cast<uint32_t>(size_mb * kSecondsPerMb);
  }
  return seconds;
}

RecoveryPlanner::RecoveryPlanner(std::shared_ptr<checkpoint::CheckpointStore> store, RecoveryPlannerOptions options, util::NowFn now)
    : store_(std::move(store)), options_(options), now_(std::move(now)) {
  if (!store_) throw util::InvalidArgument("RecoveryPlanner requires a checkpoint store");
  if (!now_) now_ = util::Now;
  if (options_.max_recovery_options == 0) options_.max_recovery_options = 5;
}

std::vector<RecoveryPoint> RecoveryPlanner::ListRecoveryPoints(const std::string& session_id) {
  std::vector<RecoveryPoint> points;

  for (const auto& record : store_->ListCheckpoints(session_id)) {
    RecoveryPoint point;
    point.id              = record.checkpoint_id;
    point.kind            = RecoveryPointKind::kCheckpoint;
    point.session_id      = record.session_id;
    point.current_step    = record.current_step;
    point.total_steps     = record.total_steps;
    point.created_at_ms   = record.created_at_ms;
    point.data_size_bytes = record.data_size_bytes;
    point.confidence      = kCheckpointConfidence;
    points.push_back(std::move(point));
  }

  for (const auto& record : store_->ListSnapshots(session_id)) {
    RecoveryPoint point;
    point.id              = record.snapshot_id;
    point.kind            = RecoveryPointKind::kSnapshot;
    point.session_id      = record.session_id;
    point.current_step    = record.current_step;
    point.total_steps     = record.total_steps;
    point.created_at_ms   = record.created_at_ms;
    point.data_size_bytes = record.data_size_bytes;
    point.confidence      = kSnapshotConfidence;
    points.push_back(std::move(point));
  }

  std::stable_sort(points.begin(), points.end(), [](const auto& a, const auto& b) { return a.created_at_ms > b.created_at_ms; });
  return points;
}

RecoveryPlanner::Evaluation RecoveryPlanner::Evaluate(const RecoveryPoint& point) {
  Evaluation eval;

  if (options_.max_recovery_age_days > 0) {
    const auto now_ms = util::ToUnixMillis(now_());
    const auto max_ms = static_cast<uint64_t>(options_.max_recovery_age_days) * kMillisPerDay;
    if (now_ms > point.created_at_ms && now_ms - point.created_at_ms > max_ms) {
      eval.status = RecoveryStatus::kExpired;
      eval.reason = std::string(ToString(point.kind)) + " " + point.id + " is older than " + std::to_string(options_.max_recovery_age_days) + " days";
      return eval;
    }
  }

  const auto report =
      point.kind == RecoveryPointKind::kCheckpoint ? store_->ValidateIntegrity(point.id) : store_->ValidateSnapshotIntegrity(point.id);
  eval.integrity_score = report.integrity_score;
  if (!report.valid) {
    eval.status = RecoveryStatus::kCorrupted;
    eval.reason = report.reason;
    return eval;
  }

  if (point.kind == RecoveryPointKind::kSnapshot && (!point.current_step || !point.total_steps)) {
    eval.status = RecoveryStatus::kPartial;
    eval.reason = "snapshot " + point.id + " carries no step counters";
    return eval;
  }

  eval.status = RecoveryStatus::kRecoverable;
  return eval;
}

RecoveryPlan RecoveryPlanner::Plan(const std::string& session_id, const std::optional<std::string>& target_id) {
  observability::SpanScope span("RecoveryPlanner.Plan");
  span.SetAttribute("jobguard.session_id", session_id);

  auto points = ListRecoveryPoints(session_id);
  if (points.empty()) {
    JOBGUARD_LOG_INFO("No recovery points for session", {observability::StringField("session_id", session_id)});
    return EmptyPlan(session_id, std::move(points), "no recovery points");
  }

  auto ranked = points;
  std::stable_sort(ranked.begin(), ranked.end(), Preferred);

  const RecoveryPoint* chosen = nullptr;
  Evaluation           eval;

  if (target_id) {
    auto it = std::find_if(ranked.begin(), ranked.end(), [&](const auto& p) { return p.id == *target_id; });
    if (it == ranked.end()) {
      return EmptyPlan(session_id, std::move(points), "recovery point " + *target_id + " not found for session");
    }
    chosen = &*it;
    eval   = Evaluate(*chosen);
  } else {
    // First RECOVERABLE point wins; the first PARTIAL one is kept as a fallback.
    std::optional<Evaluation> preferred_eval;
    const RecoveryPoint*      partial = nullptr;
    std::optional<Evaluation> partial_eval;
    for (const auto& point : ranked) {
      auto candidate = Evaluate(point);
      if (!preferred_eval) preferred_eval = candidate;

      if (candidate.status == RecoveryStatus::kRecoverable) {
        chosen = &point;
        eval   = std::move(candidate);
        break;
      }
      if (candidate.status == RecoveryStatus::kPartial) {
        if (!partial) {
          partial      = &point;
          partial_eval = std::move(candidate);
        }
        continue;
      }
      JOBGUARD_LOG_WARN("Skipping unusable recovery point", {observability::StringField("session_id", session_id),
                                                             observability::StringField("point_id", point.id),
                                                             observability::StringField("status", ToString(candidate.status)),
                                                             observability::StringField("reason", candidate.reason)});
    }
    if (!chosen && partial) {
      chosen = partial;
      eval   = std::move(*partial_eval);
    }
    if (!chosen) {
      chosen = &ranked.front();
      eval   = std::move(*preferred_eval);
    }
  }

  RecoveryPlan plan;
  plan.recovery_id       = util::PrefixedId("rec_");
  plan.session_id        = session_id;
  plan.target_id         = chosen->id;
  plan.target_kind       = chosen->kind;
  plan.strategy          = std::string(StrategyFor(*chosen));
  plan.status            = eval.status;
  plan.confidence        = chosen->confidence;
  plan.integrity_score   = eval.integrity_score;
  plan.estimated_seconds = EstimateRecoverySeconds(plan.strategy, chosen->data_size_bytes);
  plan.validation_rules  = DefaultValidationRules();
  plan.reason            = std::move(eval.reason);

  const auto option_count = std::min<size_t>(ranked.size(), options_.max_recovery_options);
  plan.recovery_options.assign(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(option_count));
  plan.recovery_points = std::move(points);

  span.SetAttribute("jobguard.recovery.status", ToString(plan.status));
  JOBGUARD_LOG_INFO("Recovery plan built", {observability::StringField("session_id", session_id),
                                            observability::StringField("recovery_id", plan.recovery_id),
                                            observability::StringField("target_id", plan.target_id),
                                            observability::StringField("strategy", plan.strategy),
                                            observability::StringField("status", ToString(plan.status))});
  return plan;
}

} // namespace jobguard::recovery
