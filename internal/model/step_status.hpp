#pragma once

#include <cstdint>
#include <string_view>

namespace jobguard::model {

// Values match jobguard.admin.v1.StepResultStatus.
enum class StepStatus : std::uint8_t {
  kSuccess              = 1,
  kFailed               = 2,
  kNotVisible           = 3,
  kNotFound             = 4,
  kError                = 5,
  kPartial              = 6,
  kTimeout              = 7,
  kRequiresIntervention = 8,
};

constexpr std::string_view ToString(StepStatus status) {
  switch (status) {
    case StepStatus::kSuccess:
      return "SUCCESS";
    case StepStatus::kFailed:
      return "FAILED";
    case StepStatus::kNotVisible:
      return "NOT_VISIBLE";
    case StepStatus::kNotFound:
      return "NOT_FOUND";
    case StepStatus::kError:
      return "ERROR";
    case StepStatus::kPartial:
      return "PARTIAL";
    case StepStatus::kTimeout:
      return "TIMEOUT";
    case StepStatus::kRequiresIntervention:
      return "REQUIRES_INTERVENTION";
  }
  return "UNKNOWN";
}

/*
  Action a route performs on its target element. Closed set: adding a
  value requires handling it in StepExecutor.
*/
enum class ActionType : std::uint8_t {
  kLocate = 0,
  kClick  = 1,
  kFill   = 2,
  kSelect = 3,
  kSubmit = 4,
};

constexpr std::string_view ToString(ActionType action) {
  switch (action) {
    case ActionType::kLocate:
      return "locate";
    case ActionType::kClick:
      return "click";
    case ActionType::kFill:
      return "fill";
    case ActionType::kSelect:
      return "select";
    case ActionType::kSubmit:
      return "submit";
  }
  return "unknown";
}

} // namespace jobguard::model
