#pragma once

#include <string_view>
#include <vector>

#include "internal/recovery/recovery_types.hpp"

namespace jobguard::recovery {

inline constexpr std::string_view kRuleStateIntegrity        = "state_integrity";
inline constexpr std::string_view kRuleCheckpointConsistency = "checkpoint_consistency";
inline constexpr std::string_view kRuleStepSequence          = "step_sequence";

// The fixed rule set attached to every plan.
std::vector<ValidationRule> DefaultValidationRules();

/*
  Runs every rule against a recovered state. Failures never throw: each
  one is recorded in rule_results and errors, and clears overall_valid.
  Unknown rule ids fail.
*/
ValidationResults RunValidationRules(const RecoveredState& state, std::string_view expected_session_id, const std::vector<ValidationRule>& rules);

} // namespace jobguard::recovery
