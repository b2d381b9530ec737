#include "internal/automation/fallback_router.hpp"

#include <algorithm>
#include <future>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace jobguard::automation {

using jobguard::model::ActionType;
using jobguard::model::StepStatus;

namespace {

constexpr std::string_view kOracleRoute     = "oracle";
constexpr std::string_view kEscalationRoute = "escalation";

std::string JoinSelectors(const std::vector<std::string>& selectors) {
  std::string out;
  for (const auto& selector : selectors) {
    if (!out.empty()) out += ", ";
    out += selector;
  }
  return out;
}

} // namespace

std::string_view ToString(RouterOutcomeKind kind) {
  switch (kind) {
    case RouterOutcomeKind::kSuccess:
      return "success";
    case RouterOutcomeKind::kRequiresIntervention:
      return "requires_intervention";
    case RouterOutcomeKind::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

FallbackRouter::FallbackRouter(PageDriver& driver, std::shared_ptr<DecisionOracle> oracle, StepLog& log, FallbackRouterOptions options,
                               util::StopToken* stop)
    : driver_(driver),
      oracle_(std::move(oracle)),
      log_(log),
      options_(options),
      stop_(stop ? stop : &own_stop_),
      executor_(driver_, log_, options_.executor, stop_) {
  if (options_.max_oracle_candidates == 0) options_.max_oracle_candidates = 25;
  if (options_.oracle_timeout.count() <= 0) options_.oracle_timeout = std::chrono::milliseconds(30000);
}

std::vector<FallbackRouter::Located> FallbackRouter::Locate(const Route& route, bool& saw_any) {
  std::vector<Located> usable;
  saw_any = false;

  for (const auto& selector : route.candidate_selectors) {
    std::vector<Element> found;
    try {
      found = driver_.FindCandidates(selector);
    } catch (const std::exception& e) {
      JOBGUARD_LOG_WARN("Candidate lookup failed", {observability::StringField("session_id", log_.session_id()),
                                                    observability::StringField("route", route.name),
                                                    observability::StringField("selector", selector),
                                                    observability::StringField("error", e.what())});
      continue;
    }

    for (auto& element : found) {
      saw_any = true;
      if (seen_.size() < options_.max_oracle_candidates) {
        seen_.push_back({selector, element.description});
      }

      bool interactable = false;
      try {
        interactable = driver_.IsInteractable(element);
      } catch (const std::exception& e) {
        JOBGUARD_LOG_WARN("Interactability check failed", {observability::StringField("session_id", log_.session_id()),
                                                           observability::StringField("selector", selector),
                                                           observability::StringField("error", e.what())});
      }
      if (interactable) usable.push_back({selector, std::move(element)});
    }
  }
  return usable;
}

std::optional<OracleSuggestion> FallbackRouter::ConsultOracle(const core::v1::MapValue& context) {
  observability::SpanScope span("FallbackRouter.ConsultOracle");

  OracleRequest request;
  request.context            = context;
  request.candidate_elements = seen_;
  try {
    request.dom_summary = driver_.DomSummary();
  } catch (const std::exception& e) {
    JOBGUARD_LOG_WARN("DOM summary unavailable", {observability::StringField("session_id", log_.session_id()),
                                                  observability::StringField("error", e.what())});
  }

  // The worker thread owns everything it touches, so a late oracle can
  // finish after we stop waiting.
  auto promise = std::make_shared<std::promise<std::optional<OracleSuggestion>>>();
  auto future  = promise->get_future();
  std::thread([oracle = oracle_, promise, request = std::move(request)] {
    try {
      promise->set_value(oracle->Suggest(request));
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(options_.oracle_timeout) != std::future_status::ready) {
    JOBGUARD_LOG_WARN("Decision oracle timed out", {observability::StringField("session_id", log_.session_id()),
                                                    observability::IntField("timeout_ms", options_.oracle_timeout.count())});
    return std::nullopt;
  }

  try {
    return future.get();
  } catch (const std::exception& e) {
    JOBGUARD_LOG_WARN("Decision oracle failed", {observability::StringField("session_id", log_.session_id()),
                                                 observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

RouterOutcome FallbackRouter::Finish(RouterOutcome outcome, size_t first_step) const {
  const auto& steps = log_.Steps();
  outcome.steps.assign(steps.begin() + static_cast<std::ptrdiff_t>(first_step), steps.end());

  if (outcome.kind == RouterOutcomeKind::kSuccess) {
    JOBGUARD_LOG_INFO("Automation target reached", {observability::StringField("session_id", log_.session_id()),
                                                    observability::StringField("route", outcome.route),
                                                    observability::StringField("selector", outcome.selector),
                                                    observability::BoolField("via_oracle", outcome.via_oracle)});
  } else {
    JOBGUARD_LOG_WARN("Automation stopped", {observability::StringField("session_id", log_.session_id()),
                                             observability::StringField("outcome", ToString(outcome.kind)),
                                             observability::StringField("reason", outcome.reason)});
  }
  return outcome;
}

RouterOutcome FallbackRouter::Run(std::vector<Route> routes, const core::v1::MapValue& context) {
  observability::SpanScope span("FallbackRouter.Run");
  span.SetAttribute("jobguard.session_id", log_.session_id());

  for (const auto& route : routes) {
    if (route.action.type == ActionType::kLocate) {
      throw util::InvalidArgument("route " + route.name + " has no executable action");
    }
  }
  std::stable_sort(routes.begin(), routes.end(), [](const Route& a, const Route& b) { return a.priority < b.priority; });

  seen_.clear();
  const size_t first_step = log_.Steps().size();

  RouterOutcome cancelled;
  cancelled.kind   = RouterOutcomeKind::kCancelled;
  cancelled.reason = "stop requested";

  for (const auto& route : routes) {
    if (stop_->StopRequested()) return Finish(cancelled, first_step);

    bool saw_any = false;
    auto located = Locate(route, saw_any);
    if (located.empty()) {
      db::model::StepRecord step;
      step.route         = route.name;
      step.action_type   = ActionType::kLocate;
      step.selector      = JoinSelectors(route.candidate_selectors);
      step.result_status = saw_any ? StepStatus::kNotVisible : StepStatus::kNotFound;
      step.reasoning     = saw_any ? "no interactable candidate" : "no candidate matched";
      log_.Append(std::move(step));
      continue;
    }

    for (auto& candidate : located) {
      auto result = executor_.Attempt(route, candidate.selector, std::move(candidate.element));
      if (result.cancelled) return Finish(cancelled, first_step);

      if (result.ok()) {
        RouterOutcome outcome;
        outcome.kind     = RouterOutcomeKind::kSuccess;
        outcome.route    = route.name;
        outcome.selector = candidate.selector;
        return Finish(std::move(outcome), first_step);
      }
      if (result.status == StepStatus::kRequiresIntervention) {
        RouterOutcome outcome;
        outcome.kind   = RouterOutcomeKind::kRequiresIntervention;
        outcome.reason = "page requires intervention on route " + route.name;
        return Finish(std::move(outcome), first_step);
      }
    }
  }

  if (oracle_ && !stop_->StopRequested()) {
    auto suggestion = ConsultOracle(context);
    if (suggestion && suggestion->confidence >= options_.oracle_confidence_threshold) {
      const RouteAction action = routes.empty() ? RouteAction{} : routes.front().action;

      std::optional<Element> target;
      try {
        for (auto& element : driver_.FindCandidates(suggestion->suggested_selector)) {
          if (driver_.IsInteractable(element)) {
            target = std::move(element);
            break;
          }
        }
      } catch (const std::exception& e) {
        JOBGUARD_LOG_WARN("Oracle selector lookup failed", {observability::StringField("session_id", log_.session_id()),
                                                            observability::StringField("selector", suggestion->suggested_selector),
                                                            observability::StringField("error", e.what())});
      }

      if (target) {
        auto result = executor_.AttemptOnce(std::string(kOracleRoute), action, suggestion->suggested_selector, *target, suggestion->reasoning);
        if (result.cancelled) return Finish(cancelled, first_step);
        if (result.ok()) {
          RouterOutcome outcome;
          outcome.kind       = RouterOutcomeKind::kSuccess;
          outcome.route      = std::string(kOracleRoute);
          outcome.selector   = suggestion->suggested_selector;
          outcome.via_oracle = true;
          return Finish(std::move(outcome), first_step);
        }
      } else {
        db::model::StepRecord step;
        step.route         = std::string(kOracleRoute);
        step.action_type   = ActionType::kLocate;
        step.selector      = suggestion->suggested_selector;
        step.result_status = StepStatus::kNotFound;
        step.reasoning     = suggestion->reasoning;
        log_.Append(std::move(step));
      }
    } else if (suggestion) {
      JOBGUARD_LOG_INFO("Oracle suggestion below confidence threshold", {observability::StringField("session_id", log_.session_id()),
                                                                          observability::DoubleField("confidence", suggestion->confidence)});
    }
  }

  if (stop_->StopRequested()) return Finish(cancelled, first_step);

  db::model::StepRecord escalation;
  escalation.route         = std::string(kEscalationRoute);
  escalation.action_type   = ActionType::kLocate;
  escalation.result_status = StepStatus::kRequiresIntervention;
  escalation.reasoning     = "all routes and the decision oracle exhausted";
  log_.Append(std::move(escalation));

  RouterOutcome outcome;
  outcome.kind   = RouterOutcomeKind::kRequiresIntervention;
  outcome.reason = "all routes and the decision oracle exhausted";
  return Finish(std::move(outcome), first_step);
}

} // namespace jobguard::automation
