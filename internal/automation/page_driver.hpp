#pragma once

#include <string>
#include <vector>

#include "internal/automation/route.hpp"
#include "internal/model/step_status.hpp"

namespace jobguard::automation {

// Opaque reference to an element, meaningful only to the driver that produced it.
struct Element {
  std::string handle;
  std::string selector;
  std::string description;
};

struct ActionResult {
  jobguard::model::StepStatus status = jobguard::model::StepStatus::kFailed;
  std::string                 detail;
};

/*
  PageDriver

  Narrow contract over whatever drives the external page. Implementations
  may throw std::exception from any call; the step executor records the
  failure as an ERROR step.

  Act() returning kRequiresIntervention (captcha, second factor) stops
  the router without further retries.
*/
class PageDriver {
 public:
  virtual ~PageDriver() = default;

  virtual std::vector<Element> FindCandidates(const std::string& selector) = 0;
  virtual bool IsInteractable(const Element& element) = 0;
  virtual ActionResult Act(const Element& element, const RouteAction& action) = 0;
  virtual std::string CurrentUrl() = 0;

  // Evidence reference (screenshot path, blob id). Empty when none.
  virtual std::string CaptureEvidence(const std::string& label) {
    (void)label;
    return {};
  }

  // Compact page description handed to the decision oracle.
  virtual std::string DomSummary() {
    return {};
  }
};

} // namespace jobguard::automation
