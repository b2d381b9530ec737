#include "internal/recovery/validation_rules.hpp"

#include <string>
#include <utility>

namespace jobguard::recovery {

namespace {

RuleResult Pass(const ValidationRule& rule) {
  return RuleResult{rule.id, true, "rule " + rule.id + " passed"};
}

RuleResult Fail(const ValidationRule& rule, std::string message) {
  return RuleResult{rule.id, false, std::move(message)};
}

RuleResult CheckStateIntegrity(const ValidationRule& rule, const RecoveredState& state) {
  if (state.kind == RecoveryPointKind::kCheckpoint) {
    if (!state.checkpoint) return Fail(rule, "recovered checkpoint payload is missing");
    if (state.checkpoint->state_data().fields().empty()) return Fail(rule, "required field state_data is missing or empty");
    if (state.checkpoint->execution_context().fields().empty()) return Fail(rule, "required field execution_context is missing or empty");
    return Pass(rule);
  }

  if (!state.snapshot) return Fail(rule, "recovered snapshot payload is missing");
  if (state.snapshot->automation_state().fields().empty()) return Fail(rule, "required field automation_state is missing or empty");
  return Pass(rule);
}

RuleResult CheckConsistency(const ValidationRule& rule, const RecoveredState& state, std::string_view expected_session_id) {
  if (state.session_id.empty()) return Fail(rule, "session id not found in recovered state");
  if (state.session_id != expected_session_id) {
    return Fail(rule, "recovered session " + state.session_id + " does not match " + std::string(expected_session_id));
  }
  return Pass(rule);
}

RuleResult CheckStepSequence(const ValidationRule& rule, const RecoveredState& state) {
  const int64_t current = state.current_step.value_or(-1);
  const int64_t total   = state.total_steps.value_or(0);
  if (current < 0 || current > total) {
    return Fail(rule, "invalid step sequence: " + std::to_string(current) + "/" + std::to_string(total));
  }
  return Pass(rule);
}

} // namespace

std::vector<ValidationRule> DefaultValidationRules() {
  return {
      {std::string(kRuleStateIntegrity), "Validate state data integrity"},
      {std::string(kRuleCheckpointConsistency), "Validate checkpoint consistency"},
      {std::string(kRuleStepSequence), "Validate step sequence logic"},
  };
}

ValidationResults RunValidationRules(const RecoveredState& state, std::string_view expected_session_id, const std::vector<ValidationRule>& rules) {
  ValidationResults results;

  for (const auto& rule : rules) {
    RuleResult outcome;
    if (rule.id == kRuleStateIntegrity) {
      outcome = CheckStateIntegrity(rule, state);
    } else if (rule.id == kRuleCheckpointConsistency) {
      outcome = CheckConsistency(rule, state, expected_session_id);
    } else if (rule.id == kRuleStepSequence) {
      outcome = CheckStepSequence(rule, state);
    } else {
      outcome = Fail(rule, "unknown validation rule " + rule.id);
    }

    if (!outcome.passed) {
      results.overall_valid = false;
      results.errors.push_back(rule.id + ": " + outcome.message);
    }
    results.rule_results.push_back(std::move(outcome));
  }

  if (state.kind == RecoveryPointKind::kSnapshot) {
    results.warnings.emplace_back("recovered from snapshot; automation state may be incomplete");
  }
  return results;
}

} // namespace jobguard::recovery
