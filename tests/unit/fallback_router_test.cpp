#include "internal/automation/fallback_router.hpp"

#include <cassert>
#include <chrono>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using jobguard::automation::ActionResult;
using jobguard::automation::DecisionOracle;
using jobguard::automation::Element;
using jobguard::automation::FallbackRouter;
using jobguard::automation::FallbackRouterOptions;
using jobguard::automation::OracleRequest;
using jobguard::automation::OracleSuggestion;
using jobguard::automation::PageDriver;
using jobguard::automation::Route;
using jobguard::automation::RouteAction;
using jobguard::automation::RouterOutcomeKind;
using jobguard::automation::StepLog;
using jobguard::model::ActionType;
using jobguard::model::StepStatus;

/*
  Scripted page. Each selector maps to the elements it resolves to; each
  element handle has a queue of Act() results, the last one repeating.
*/
class FakeDriver final : public PageDriver {
 public:
  void AddElement(const std::string& selector, const std::string& handle, bool interactable, std::vector<StepStatus> results) {
    elements_[selector].push_back(Element{handle, selector, "element " + handle});
    interactable_[handle] = interactable;
    results_[handle]      = std::deque<StepStatus>(results.begin(), results.end());
  }

  void ReplaceElements(const std::string& selector, const std::string& handle, std::vector<StepStatus> results) {
    elements_[selector].clear();
    AddElement(selector, handle, true, std::move(results));
  }

  std::vector<Element> FindCandidates(const std::string& selector) override {
    ++lookups_[selector];
    auto it = elements_.find(selector);
    if (it == elements_.end()) return {};
    return it->second;
  }

  bool IsInteractable(const Element& element) override {
    return interactable_[element.handle];
  }

  ActionResult Act(const Element& element, const RouteAction& action) override {
    acted_.push_back(element.handle);
    last_action_ = action.type;
    if (on_act_) on_act_(element);

    auto& queue = results_[element.handle];
    if (queue.empty()) return {StepStatus::kFailed, "no scripted result"};
    const auto status = queue.front();
    if (queue.size() > 1) queue.pop_front();
    return {status, {}};
  }

  std::string CurrentUrl() override {
    return "https://portal.example/upload";
  }

  std::string CaptureEvidence(const std::string& label) override {
    return "evidence/" + label + ".png";
  }

  std::map<std::string, std::vector<Element>>  elements_;
  std::map<std::string, bool>                  interactable_;
  std::map<std::string, std::deque<StepStatus>> results_;
  std::map<std::string, int>                   lookups_;
  std::vector<std::string>                     acted_;
  ActionType                                   last_action_ = ActionType::kLocate;
  std::function<void(const Element&)>          on_act_;
};

class FixedOracle final : public DecisionOracle {
 public:
  explicit FixedOracle(std::optional<OracleSuggestion> suggestion) : suggestion_(std::move(suggestion)) {
  }

  std::optional<OracleSuggestion> Suggest(const OracleRequest& request) override {
    std::lock_guard lock(mutex_);
    ++calls_;
    last_request_ = request;
    return suggestion_;
  }

  std::mutex                      mutex_;
  int                             calls_ = 0;
  OracleRequest                   last_request_;
  std::optional<OracleSuggestion> suggestion_;
};

class ThrowingOracle final : public DecisionOracle {
 public:
  std::optional<OracleSuggestion> Suggest(const OracleRequest&) override {
    throw std::runtime_error("model unavailable");
  }
};

// Blocks until released, to model an oracle that answers too late.
class SlowOracle final : public DecisionOracle {
 public:
  std::optional<OracleSuggestion> Suggest(const OracleRequest&) override {
    release_.wait();
    return OracleSuggestion{"#late", 1.0, "late answer", {}};
  }

  std::promise<void>       gate_;
  std::shared_future<void> release_ = gate_.get_future().share();
};

Route MakeRoute(const std::string& name, int32_t priority, std::vector<std::string> selectors, bool is_dynamic = false) {
  Route route;
  route.name                = name;
  route.priority            = priority;
  route.candidate_selectors = std::move(selectors);
  route.is_dynamic          = is_dynamic;
  route.action.type         = ActionType::kClick;
  return route;
}

FallbackRouterOptions FastOptions(uint32_t max_retries = 2) {
  FallbackRouterOptions options;
  options.executor.max_retries  = max_retries;
  options.executor.backoff_base = std::chrono::milliseconds(1);
  options.oracle_timeout        = std::chrono::milliseconds(2000);
  return options;
}

struct Fixture {
  std::shared_ptr<jobguard::db::memory::MemoryRepository> repo = std::make_shared<jobguard::db::memory::MemoryRepository>();
  StepLog                                                  log{repo, "session-router"};
  FakeDriver                                               driver;

  std::vector<jobguard::db::model::StepRecord> Persisted() {
    auto tx    = repo->Begin();
    auto steps = repo->ListSteps(*tx, "session-router");
    tx->Commit();
    return steps;
  }
};

void TestRoutesRunInPriorityOrder() {
  Fixture fx;
  fx.driver.AddElement("#header-upload", "h1", true, {StepStatus::kFailed});
  fx.driver.AddElement("#hero-upload", "b1", true, {StepStatus::kFailed});
  fx.driver.AddElement("#footer-upload", "f1", true, {StepStatus::kSuccess});

  FallbackRouter router(fx.driver, nullptr, fx.log, FastOptions(2));
  const auto     outcome = router.Run({MakeRoute("footer", 3, {"#footer-upload"}), MakeRoute("header", 1, {"#header-upload"}),
                                       MakeRoute("hero", 2, {"#hero-upload"})});

  assert(outcome.kind == RouterOutcomeKind::kSuccess);
  assert(outcome.route == "footer");
  assert(outcome.selector == "#footer-upload");
  assert(!outcome.via_oracle);

  const std::vector<std::string> expected = {"header", "header", "hero", "hero", "footer"};
  assert(outcome.steps.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    assert(outcome.steps[i].route == expected[i]);
    assert(outcome.steps[i].step_number == i + 1);
  }
  assert(!outcome.steps[0].retry_used);
  assert(outcome.steps[1].retry_used);
  assert(outcome.steps.back().result_status == StepStatus::kSuccess);

  // Persisted rows match the in-memory log.
  const auto persisted = fx.Persisted();
  assert(persisted.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) assert(persisted[i].route == expected[i]);
}

void TestUnusableCandidatesAreNeverActedOn() {
  Fixture fx;
  fx.driver.AddElement("#hidden", "x1", false, {StepStatus::kSuccess});
  fx.driver.AddElement("#fallback", "ok", true, {StepStatus::kSuccess});

  FallbackRouter router(fx.driver, nullptr, fx.log, FastOptions());
  const auto outcome = router.Run({MakeRoute("hidden", 1, {"#hidden"}), MakeRoute("missing", 2, {"#nope"}), MakeRoute("fallback", 3, {"#fallback"})});

  assert(outcome.kind == RouterOutcomeKind::kSuccess);
  assert(fx.driver.acted_ == std::vector<std::string>{"ok"});

  assert(outcome.steps.size() == 3);
  assert(outcome.steps[0].action_type == ActionType::kLocate);
  assert(outcome.steps[0].result_status == StepStatus::kNotVisible);
  assert(outcome.steps[1].result_status == StepStatus::kNotFound);
  assert(outcome.steps[2].result_status == StepStatus::kSuccess);
}

void TestInterventionStopsImmediately() {
  Fixture fx;
  fx.driver.AddElement("#login", "l1", true, {StepStatus::kRequiresIntervention});
  fx.driver.AddElement("#other", "o1", true, {StepStatus::kSuccess});

  auto           oracle = std::make_shared<FixedOracle>(OracleSuggestion{"#other", 0.99, "", {}});
  FallbackRouter router(fx.driver, oracle, fx.log, FastOptions(3));
  const auto     outcome = router.Run({MakeRoute("login", 1, {"#login"}), MakeRoute("other", 2, {"#other"})});

  assert(outcome.kind == RouterOutcomeKind::kRequiresIntervention);
  assert(fx.driver.acted_ == std::vector<std::string>{"l1"});
  assert(oracle->calls_ == 0);
  assert(outcome.steps.size() == 1);
}

void TestOracleSuggestionGetsOneAttempt() {
  Fixture fx;
  fx.driver.AddElement("#upload", "u1", true, {StepStatus::kFailed});
  fx.driver.AddElement("button[data-action=upload]", "alt", true, {StepStatus::kSuccess});

  auto oracle = std::make_shared<FixedOracle>(OracleSuggestion{"button[data-action=upload]", 0.85, "button labelled upload", {}});

  FallbackRouter router(fx.driver, oracle, fx.log, FastOptions(1));
  const auto     outcome = router.Run({MakeRoute("primary", 1, {"#upload"})});

  assert(outcome.kind == RouterOutcomeKind::kSuccess);
  assert(outcome.via_oracle);
  assert(outcome.route == "oracle");
  assert(outcome.selector == "button[data-action=upload]");
  assert(oracle->calls_ == 1);
  assert(oracle->last_request_.candidate_elements.size() == 1);
  assert(oracle->last_request_.candidate_elements.front().selector == "#upload");

  assert(outcome.steps.size() == 2);
  assert(outcome.steps[1].route == "oracle");
  assert(outcome.steps[1].reasoning == "button labelled upload");
}

void TestLowConfidenceOracleEscalates() {
  Fixture fx;
  fx.driver.AddElement("#upload", "u1", true, {StepStatus::kFailed});
  fx.driver.AddElement("#guess", "g1", true, {StepStatus::kSuccess});

  auto           oracle = std::make_shared<FixedOracle>(OracleSuggestion{"#guess", 0.4, "unsure", {}});
  FallbackRouter router(fx.driver, oracle, fx.log, FastOptions(1));
  const auto     outcome = router.Run({MakeRoute("primary", 1, {"#upload"})});

  assert(outcome.kind == RouterOutcomeKind::kRequiresIntervention);
  assert(fx.driver.acted_ == std::vector<std::string>{"u1"});
  assert(outcome.steps.back().route == "escalation");
  assert(outcome.steps.back().result_status == StepStatus::kRequiresIntervention);
}

void TestFailingOrSlowOracleCountsAsNoSuggestion() {
  {
    Fixture        fx;
    FallbackRouter router(fx.driver, std::make_shared<ThrowingOracle>(), fx.log, FastOptions(1));
    const auto     outcome = router.Run({MakeRoute("primary", 1, {"#missing"})});
    assert(outcome.kind == RouterOutcomeKind::kRequiresIntervention);
  }
  {
    Fixture fx;
    fx.driver.AddElement("#late", "late", true, {StepStatus::kSuccess});

    auto options           = FastOptions(1);
    options.oracle_timeout = std::chrono::milliseconds(20);

    auto           oracle = std::make_shared<SlowOracle>();
    FallbackRouter router(fx.driver, oracle, fx.log, options);

    const auto started = std::chrono::steady_clock::now();
    const auto outcome = router.Run({MakeRoute("primary", 1, {"#missing"})});
    assert(outcome.kind == RouterOutcomeKind::kRequiresIntervention);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    assert(fx.driver.acted_.empty());

    oracle->gate_.set_value();
  }
}

void TestDynamicRouteIsResolvedAgainBeforeRetry() {
  Fixture fx;
  fx.driver.AddElement("#row-submit", "old", true, {StepStatus::kFailed});
  fx.driver.on_act_ = [&](const Element& element) {
    if (element.handle == "old") fx.driver.ReplaceElements("#row-submit", "new", {StepStatus::kSuccess});
  };

  FallbackRouter router(fx.driver, nullptr, fx.log, FastOptions(3));
  const auto     outcome = router.Run({MakeRoute("table", 1, {"#row-submit"}, /*is_dynamic=*/true)});

  assert(outcome.kind == RouterOutcomeKind::kSuccess);
  assert((fx.driver.acted_ == std::vector<std::string>{"old", "new"}));
  assert(fx.driver.lookups_["#row-submit"] == 2);
}

void TestStopTokenCancelsRun() {
  Fixture fx;
  fx.driver.AddElement("#upload", "u1", true, {StepStatus::kSuccess});

  jobguard::util::StopToken stop;
  stop.RequestStop();

  FallbackRouter router(fx.driver, nullptr, fx.log, FastOptions(), &stop);
  const auto     outcome = router.Run({MakeRoute("primary", 1, {"#upload"})});

  assert(outcome.kind == RouterOutcomeKind::kCancelled);
  assert(fx.driver.acted_.empty());
}

void TestActionsNeedWhatTheyAct() {
  Fixture fx;
  fx.driver.AddElement("#amount", "a1", true, {StepStatus::kSuccess});

  auto fill        = MakeRoute("amount", 1, {"#amount"});
  fill.action.type = ActionType::kFill;

  FallbackRouter router(fx.driver, nullptr, fx.log, FastOptions(1));
  const auto     outcome = router.Run({fill});
  assert(outcome.kind == RouterOutcomeKind::kRequiresIntervention);
  assert(fx.driver.acted_.empty());
  assert(outcome.steps.front().result_status == StepStatus::kError);

  auto locate        = MakeRoute("locate", 1, {"#amount"});
  locate.action.type = ActionType::kLocate;

  bool threw = false;
  try {
    (void)router.Run({locate});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestRetryBackoffDoubles() {
  using std::chrono::milliseconds;
  assert(jobguard::automation::RetryBackoff(milliseconds(100), 0) == milliseconds(100));
  assert(jobguard::automation::RetryBackoff(milliseconds(100), 1) == milliseconds(200));
  assert(jobguard::automation::RetryBackoff(milliseconds(100), 2) == milliseconds(400));

  Fixture fx;
  fx.driver.AddElement("#pay", "p1", true, {StepStatus::kFailed});
  std::vector<std::chrono::steady_clock::time_point> acted_at;
  fx.driver.on_act_ = [&](const Element&) { acted_at.push_back(std::chrono::steady_clock::now()); };

  auto options                  = FastOptions(4);
  options.executor.backoff_base = milliseconds(40);
  FallbackRouter router(fx.driver, nullptr, fx.log, options);
  const auto     outcome = router.Run({MakeRoute("pay", 1, {"#pay"})});
  assert(outcome.kind != RouterOutcomeKind::kSuccess);

  assert(acted_at.size() == 4);
  for (size_t i = 1; i < acted_at.size(); ++i) {
    const auto gap = std::chrono::duration_cast<milliseconds>(acted_at[i] - acted_at[i - 1]);
    assert(gap >= jobguard::automation::RetryBackoff(options.executor.backoff_base, static_cast<uint32_t>(i - 1)));
  }
}

void TestResumedSessionContinuesNumbering() {
  Fixture fx;
  for (int i = 0; i < 3; ++i) {
    jobguard::db::model::StepRecord step;
    step.route         = "primary";
    step.action_type   = ActionType::kClick;
    step.selector      = "#next";
    step.result_status = StepStatus::kSuccess;
    fx.log.Append(step);
  }

  StepLog                         resumed(fx.repo, "session-router");
  jobguard::db::model::StepRecord step;
  step.route         = "primary";
  step.action_type   = ActionType::kSubmit;
  step.selector      = "#finish";
  step.result_status = StepStatus::kSuccess;
  const auto stored  = resumed.Append(step);
  assert(stored.step_number == 4);

  const auto persisted = fx.Persisted();
  assert(persisted.size() == 4);
  assert(persisted.back().step_number == 4);
  assert(persisted.back().selector == "#finish");
}

void TestEvidenceIsCapturedOnFailure() {
  Fixture fx;
  fx.driver.AddElement("#upload", "u1", true, {StepStatus::kFailed});

  auto options                      = FastOptions(1);
  options.executor.capture_evidence = true;

  FallbackRouter router(fx.driver, nullptr, fx.log, options);
  const auto     outcome = router.Run({MakeRoute("primary", 1, {"#upload"})});

  assert(outcome.steps.front().evidence_ref == "evidence/primary-#upload.png");

  const auto summary = fx.log.Summary();
  assert(summary.attempts == 1);
  assert(summary.successes == 0);
}

} // namespace

int main() {
  TestRoutesRunInPriorityOrder();
  TestUnusableCandidatesAreNeverActedOn();
  TestInterventionStopsImmediately();
  TestOracleSuggestionGetsOneAttempt();
  TestLowConfidenceOracleEscalates();
  TestFailingOrSlowOracleCountsAsNoSuggestion();
  TestDynamicRouteIsResolvedAgainBeforeRetry();
  TestStopTokenCancelsRun();
  TestActionsNeedWhatTheyAct();
  TestEvidenceIsCapturedOnFailure();
  TestRetryBackoffDoubles();
  TestResumedSessionContinuesNumbering();

  std::cout << "jobguard_unit_fallback_router: pass\n";
  return 0;
}
