#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "internal/automation/page_driver.hpp"
#include "internal/automation/route.hpp"
#include "internal/automation/step_log.hpp"
#include "internal/util/stop_token.hpp"

namespace jobguard::automation {

struct StepExecutorOptions {
  uint32_t                  max_retries = 3;
  std::chrono::milliseconds backoff_base{1000};
  bool                      capture_evidence = false;
};

// Wait before retry number `retry` (0-based): base * 2^retry.
std::chrono::milliseconds RetryBackoff(std::chrono::milliseconds base, uint32_t retry);

struct AttemptResult {
  jobguard::model::StepStatus status    = jobguard::model::StepStatus::kFailed;
  bool                        cancelled = false;

  bool ok() const {
    return status == jobguard::model::StepStatus::kSuccess;
  }
};

/*
  StepExecutor

  Runs one route action against one located element. Failures are
  retried up to max_retries attempts with base * 2^attempt backoff; the
  element is re-validated before every retry. Every attempt appends one
  step to the log. Transient driver errors never leave this class.
*/
class StepExecutor {
 public:
  StepExecutor(PageDriver& driver, StepLog& log, StepExecutorOptions options = {}, util::StopToken* stop = nullptr);

  AttemptResult Attempt(const Route& route, const std::string& selector, Element element);

  // Single attempt without retry. Used for the oracle's last-resort suggestion.
  AttemptResult AttemptOnce(const std::string& route_name, const RouteAction& action, const std::string& selector, const Element& element,
                            const std::string& reasoning, bool retry_used = false);

 private:
  // Re-resolves or re-checks the element before a retry. False when it is gone.
  bool Revalidate(const Route& route, const std::string& selector, Element& element, jobguard::model::StepStatus& status);

  ActionResult Perform(const Element& element, const RouteAction& action);

  PageDriver&         driver_;
  StepLog&            log_;
  StepExecutorOptions options_;
  util::StopToken*    stop_;
  util::StopToken     own_stop_;
};

} // namespace jobguard::automation
