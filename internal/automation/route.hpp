#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/step_status.hpp"

namespace jobguard::automation {

// What a route does once its target is located. `value` is the text
// for FILL and the option for SELECT.
struct RouteAction {
  jobguard::model::ActionType type = jobguard::model::ActionType::kClick;
  std::optional<std::string>  value;
};

/*
  One strategy for locating and acting on a target. Lower priority runs
  first. Dynamic routes re-resolve their selector before every retry
  because the element is expected to be re-rendered.
*/
struct Route {
  std::string              name;
  int32_t                  priority = 0;
  std::vector<std::string> candidate_selectors;
  bool                     is_dynamic = false;
  RouteAction              action;
};

} // namespace jobguard::automation
