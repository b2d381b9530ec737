#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/automation/decision_oracle.hpp"
#include "internal/automation/page_driver.hpp"
#include "internal/automation/route.hpp"
#include "internal/automation/step_executor.hpp"
#include "internal/automation/step_log.hpp"
#include "internal/util/stop_token.hpp"

namespace jobguard::automation {

struct FallbackRouterOptions {
  StepExecutorOptions       executor;
  double                    oracle_confidence_threshold = 0.7;
  std::chrono::milliseconds oracle_timeout{30000};
  uint32_t                  max_oracle_candidates = 25;
};

enum class RouterOutcomeKind {
  kSuccess,
  kRequiresIntervention,
  kCancelled,
};

std::string_view ToString(RouterOutcomeKind kind);

struct RouterOutcome {
  RouterOutcomeKind kind = RouterOutcomeKind::kRequiresIntervention;

  // Set on success.
  std::string route;
  std::string selector;
  bool        via_oracle = false;

  std::string reason;

  // Steps appended during this run.
  std::vector<db::model::StepRecord> steps;
};

/*
  FallbackRouter

  Walks routes in ascending priority. Candidates that are not
  interactable are skipped without an attempt; a route left with no
  usable candidate records a single NOT_FOUND / NOT_VISIBLE step. The
  first success anywhere ends the run.

  When every route is exhausted the decision oracle is consulted once;
  a suggestion at or above the confidence threshold gets exactly one
  attempt. Otherwise the run ends in REQUIRES_INTERVENTION, which is
  never retried here.
*/
class FallbackRouter {
 public:
  FallbackRouter(PageDriver& driver, std::shared_ptr<DecisionOracle> oracle, StepLog& log, FallbackRouterOptions options = {},
                 util::StopToken* stop = nullptr);

  RouterOutcome Run(std::vector<Route> routes, const core::v1::MapValue& context = {});

 private:
  struct Located {
    std::string selector;
    Element     element;
  };

  std::vector<Located>            Locate(const Route& route, bool& saw_any);
  std::optional<OracleSuggestion> ConsultOracle(const core::v1::MapValue& context);
  RouterOutcome                   Finish(RouterOutcome outcome, size_t first_step) const;

  PageDriver&                     driver_;
  std::shared_ptr<DecisionOracle> oracle_;
  StepLog&                        log_;
  FallbackRouterOptions           options_;
  util::StopToken*                stop_;
  util::StopToken                 own_stop_;
  StepExecutor                    executor_;

  // Every element seen during the run, summarized for the oracle.
  std::vector<CandidateElement> seen_;
};

} // namespace jobguard::automation
