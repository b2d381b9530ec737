#include "internal/automation/step_log.hpp"

#include <algorithm>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"

namespace jobguard::automation {

namespace {

constexpr int kStepConflictAttempts = 8;

} // namespace

StepSummary Summarize(const std::vector<db::model::StepRecord>& steps) {
  StepSummary summary;
  for (const auto& step : steps) {
    summary.total_time_ms += step.timing_ms;
    if (step.action_type == jobguard::model::ActionType::kLocate) continue;
    ++summary.attempts;
    if (step.result_status == jobguard::model::StepStatus::kSuccess) ++summary.successes;
  }
  if (summary.attempts > 0) {
    summary.success_rate = static_cast<double>(summary.successes) / static_cast<double>(summary.attempts);
  }
  return summary;
}

StepLog::StepLog(std::shared_ptr<db::Repository> repository, std::string session_id, util::NowFn now)
    : repository_(std::move(repository)), session_id_(std::move(session_id)), now_(std::move(now)) {
  if (!repository_) throw util::InvalidArgument("StepLog requires a repository");
  if (session_id_.empty()) throw util::InvalidArgument("StepLog requires a session id");
  if (!now_) now_ = util::Now;

  auto tx    = repository_->Begin();
  next_step_ = repository_->MaxStepNumber(*tx, session_id_) + 1;
}

db::model::StepRecord StepLog::Append(db::model::StepRecord step) {
  step.session_id    = session_id_;
  step.created_at_ms = util::ToUnixMillis(now_());

  db::RetryOnConflict(kStepConflictAttempts, [&] {
    auto tx = repository_->Begin();
    // Another writer on the same session may have taken our number.
    step.step_number = std::max(next_step_, repository_->MaxStepNumber(*tx, session_id_) + 1);

    auto res = repository_->AppendStep(*tx, step);
    db::ThrowIfConflict(res);
    if (!res) throw std::runtime_error("append step: " + res.message);
    tx->Commit();
  });
  next_step_ = step.step_number + 1;

  JOBGUARD_LOG_DEBUG("Automation step recorded", {observability::StringField("session_id", session_id_),
                                                  observability::IntField("step_number", static_cast<int64_t>(step.step_number)),
                                                  observability::StringField("route", step.route),
                                                  observability::StringField("result", jobguard::model::ToString(step.result_status))});
  steps_.push_back(step);
  return step;
}

} // namespace jobguard::automation
