#include "internal/automation/step_executor.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace jobguard::automation {

using jobguard::model::ActionType;
using jobguard::model::StepStatus;

namespace {

bool Retryable(StepStatus status) {
  switch (status) {
    case StepStatus::kSuccess:
    case StepStatus::kRequiresIntervention:
      return false;
    case StepStatus::kFailed:
    case StepStatus::kNotVisible:
    case StepStatus::kNotFound:
    case StepStatus::kError:
    case StepStatus::kPartial:
    case StepStatus::kTimeout:
      return true;
  }
  return false;
}

} // namespace

std::chrono::milliseconds RetryBackoff(std::chrono::milliseconds base, uint32_t retry) {
  return base * (int64_t{1} << std::min<uint32_t>(retry, 16));
}

StepExecutor::StepExecutor(PageDriver& driver, StepLog& log, StepExecutorOptions options, util::StopToken* stop)
    : driver_(driver), log_(log), options_(options), stop_(stop ? stop : &own_stop_) {
  if (options_.max_retries == 0) options_.max_retries = 3;
}

ActionResult StepExecutor::Perform(const Element& element, const RouteAction& action) {
  switch (action.type) {
    case ActionType::kLocate:
      return {StepStatus::kError, "locate is not an executable route action"};
    case ActionType::kFill:
    case ActionType::kSelect:
      if (!action.value) {
        return {StepStatus::kError, std::string(jobguard::model::ToString(action.type)) + " requires a value"};
      }
      break;
    case ActionType::kClick:
    case ActionType::kSubmit:
      break;
  }

  try {
    return driver_.Act(element, action);
  } catch (const std::exception& e) {
    return {StepStatus::kError, e.what()};
  }
}

AttemptResult StepExecutor::AttemptOnce(const std::string& route_name, const RouteAction& action, const std::string& selector,
                                        const Element& element, const std::string& reasoning, bool retry_used) {
  AttemptResult result;
  if (stop_->StopRequested()) {
    result.cancelled = true;
    return result;
  }

  const auto start   = std::chrono::steady_clock::now();
  auto       outcome = Perform(element, action);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

  db::model::StepRecord step;
  step.route         = route_name;
  step.action_type   = action.type;
  step.selector      = selector;
  step.result_status = outcome.status;
  step.timing_ms     = static_cast<uint64_t>(elapsed.count());
  step.retry_used    = retry_used;
  step.reasoning     = outcome.detail.empty() ? reasoning : (reasoning.empty() ? outcome.detail : reasoning + ": " + outcome.detail);

  if (options_.capture_evidence && outcome.status != StepStatus::kSuccess) {
    try {
      step.evidence_ref = driver_.CaptureEvidence(route_name + "-" + selector);
    } catch (const std::exception& e) {
      JOBGUARD_LOG_WARN("Evidence capture failed", {observability::StringField("session_id", log_.session_id()),
                                                    observability::StringField("error", e.what())});
    }
  }

  log_.Append(std::move(step));
  observability::Metrics::Instance().RecordStepAttempt(jobguard::model::ToString(outcome.status), static_cast<double>(elapsed.count()));

  result.status = outcome.status;
  return result;
}

bool StepExecutor::Revalidate(const Route& route, const std::string& selector, Element& element, StepStatus& status) {
  try {
    if (!route.is_dynamic) {
      if (driver_.IsInteractable(element)) return true;
      status = StepStatus::kNotVisible;
      return false;
    }

    auto candidates = driver_.FindCandidates(selector);
    if (candidates.empty()) {
      status = StepStatus::kNotFound;
      return false;
    }
    for (auto& candidate : candidates) {
      if (driver_.IsInteractable(candidate)) {
        element = std::move(candidate);
        return true;
      }
    }
    status = StepStatus::kNotVisible;
    return false;
  } catch (const std::exception& e) {
    JOBGUARD_LOG_WARN("Element revalidation failed", {observability::StringField("session_id", log_.session_id()),
                                                      observability::StringField("route", route.name),
                                                      observability::StringField("error", e.what())});
    status = StepStatus::kError;
    return false;
  }
}

AttemptResult StepExecutor::Attempt(const Route& route, const std::string& selector, Element element) {
  observability::SpanScope span("StepExecutor.Attempt");
  span.SetAttribute("jobguard.route", route.name);

  AttemptResult result;
  for (uint32_t attempt = 0; attempt < options_.max_retries; ++attempt) {
    if (attempt > 0) {
      if (!stop_->WaitFor(RetryBackoff(options_.backoff_base, attempt - 1))) {
        result.cancelled = true;
        return result;
      }

      StepStatus lost = StepStatus::kNotVisible;
      if (!Revalidate(route, selector, element, lost)) {
        db::model::StepRecord step;
        step.route         = route.name;
        step.action_type   = ActionType::kLocate;
        step.selector      = selector;
        step.result_status = lost;
        step.retry_used    = true;
        step.reasoning     = "element no longer usable before retry";
        log_.Append(std::move(step));

        result.status = lost;
        return result;
      }
    }

    result = AttemptOnce(route.name, route.action, selector, element, {}, attempt > 0);
    if (result.cancelled || !Retryable(result.status)) return result;
  }
  return result;
}

} // namespace jobguard::automation
