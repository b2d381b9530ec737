#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "jobguard/core/v1/checkpoint.pb.h"

namespace jobguard::recovery {

// Values match jobguard.admin.v1.RecoveryStatus.
enum class RecoveryStatus : uint8_t {
  kRecoverable = 1,
  kPartial     = 2,
  kCorrupted   = 3,
  kExpired     = 4,
  kMissing     = 5,
};

// Values match jobguard.admin.v1.RecoveryPointKind.
enum class RecoveryPointKind : uint8_t {
  kCheckpoint = 1,
  kSnapshot   = 2,
};

constexpr std::string_view ToString(RecoveryStatus status) {
  switch (status) {
    case RecoveryStatus::kRecoverable:
      return "recoverable";
    case RecoveryStatus::kPartial:
      return "partial";
    case RecoveryStatus::kCorrupted:
      return "corrupted";
    case RecoveryStatus::kExpired:
      return "expired";
    case RecoveryStatus::kMissing:
      return "missing";
  }
  return "unknown";
}

constexpr std::string_view ToString(RecoveryPointKind kind) {
  switch (kind) {
    case RecoveryPointKind::kCheckpoint:
      return "checkpoint";
    case RecoveryPointKind::kSnapshot:
      return "snapshot";
  }
  return "unknown";
}

inline constexpr double kCheckpointConfidence = 0.95;
inline constexpr double kSnapshotConfidence   = 0.90;

inline constexpr std::string_view kDirectCheckpointRecovery = "direct_checkpoint_recovery";
inline constexpr std::string_view kCheckpointWithValidation = "checkpoint_with_validation";
inline constexpr std::string_view kSnapshotRecovery         = "snapshot_recovery";

struct RecoveryPoint {
  std::string       id;
  RecoveryPointKind kind = RecoveryPointKind::kCheckpoint;
  std::string       session_id;

  std::optional<int64_t> current_step;
  std::optional<int64_t> total_steps;

  uint64_t created_at_ms   = 0;
  uint64_t data_size_bytes = 0;
  double   confidence      = 0.0;
};

struct ValidationRule {
  std::string id;
  std::string description;
};

struct RuleResult {
  std::string rule_id;
  bool        passed = false;
  std::string message;
};

struct ValidationResults {
  bool                     overall_valid = true;
  std::vector<RuleResult>  rule_results;
  std::vector<std::string> warnings;
  std::vector<std::string> errors;
};

/*
  RecoveryPlan

  Built fresh for every recovery attempt and never mutated afterwards.
  `target_id` is empty only when status is kMissing.
*/
struct RecoveryPlan {
  std::string recovery_id;
  std::string session_id;

  std::string       target_id;
  RecoveryPointKind target_kind = RecoveryPointKind::kCheckpoint;
  std::string       strategy;

  std::vector<RecoveryPoint> recovery_points;
  RecoveryStatus             status = RecoveryStatus::kMissing;

  double   confidence        = 0.0;
  double   integrity_score   = 0.0;
  uint32_t estimated_seconds = 0;

  std::vector<RecoveryPoint>  recovery_options;
  std::vector<ValidationRule> validation_rules;

  // Human readable cause for anything other than kRecoverable.
  std::string reason;
};

// State reconstructed from the plan's target.
struct RecoveredState {
  RecoveryPointKind kind = RecoveryPointKind::kCheckpoint;
  std::string       recovered_from;
  std::string       session_id;

  std::optional<int64_t> current_step;
  std::optional<int64_t> total_steps;

  std::optional<core::v1::Checkpoint>      checkpoint;
  std::optional<core::v1::SessionSnapshot> snapshot;
};

struct RecoveryResult {
  bool        success = false;
  std::string recovery_id;
  std::string session_id;
  std::string target_id;
  std::string strategy;

  std::optional<RecoveredState> state;
  ValidationResults             validation;

  uint64_t    recovery_time_ms = 0;
  std::string error;
};

} // namespace jobguard::recovery
