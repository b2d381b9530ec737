#pragma once

#include <cstdint>
#include <string_view>

namespace jobguard::model {

// Values match jobguard.admin.v1.JobStatus.
enum class JobStatus : std::uint8_t {
  kPending    = 1,
  kClaimed    = 2,
  kProcessing = 3,
  kCompleted  = 4,
  kFailed     = 5,
  kTimeout    = 6,
  kCancelled  = 7,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed || status == JobStatus::kTimeout || status == JobStatus::kCancelled;
}

// A worker currently owns the row.
constexpr bool IsActive(JobStatus status) {
  return status == JobStatus::kClaimed || status == JobStatus::kProcessing;
}

/*
  Transitions reachable through ClaimStore::Transition. Claiming and
  re-claiming are handled by ClaimStore::Claim and are not listed here.
*/
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == JobStatus::kTimeout || to == JobStatus::kCancelled) {
    return true;
  }
  if (from == JobStatus::kClaimed) {
    return to == JobStatus::kProcessing;
  }
  if (from == JobStatus::kProcessing) {
    return to == JobStatus::kCompleted || to == JobStatus::kFailed;
  }
  return false;
}

constexpr std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kPending:
      return "PENDING";
    case JobStatus::kClaimed:
      return "CLAIMED";
    case JobStatus::kProcessing:
      return "PROCESSING";
    case JobStatus::kCompleted:
      return "COMPLETED";
    case JobStatus::kFailed:
      return "FAILED";
    case JobStatus::kTimeout:
      return "TIMEOUT";
    case JobStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

} // namespace jobguard::model
