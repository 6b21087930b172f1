#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "deployment.hpp"

namespace kuberoll::model {

struct RolloutTarget {
  Deployment  deployment;
  std::string expected_build;

  const std::string& Name() const {
    return deployment.name;
  }
};

enum class OutcomeStatus : std::uint8_t {
  kConverged      = 0,
  kReported       = 1,
  kErrored        = 2,
  kMutationFailed = 3,
  kTimedOut       = 4,
  kSkipped        = 5,
};

constexpr bool IsFailure(OutcomeStatus status) {
  return status != OutcomeStatus::kConverged && status != OutcomeStatus::kReported;
}

constexpr std::string_view ToString(OutcomeStatus status) {
  switch (status) {
    case OutcomeStatus::kConverged:
      return "converged";
    case OutcomeStatus::kReported:
      return "reported";
    case OutcomeStatus::kErrored:
      return "errored";
    case OutcomeStatus::kMutationFailed:
      return "mutation-failed";
    case OutcomeStatus::kTimedOut:
      return "timed-out";
    case OutcomeStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

/*
  Final word on one requested target. `name` is the resolved deployment
  name, or the raw CLI input when resolution itself failed.
*/
struct TargetOutcome {
  std::string   name;
  OutcomeStatus status{OutcomeStatus::kSkipped};
  std::string   build;
  std::uint32_t succeeded{0};
  std::uint32_t failed{0};
  std::string   message;
};

} // namespace kuberoll::model
