#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/instance.hpp"
#include "internal/model/rollout_target.hpp"

namespace kuberoll::rollout {

enum class InstanceHealth : std::uint8_t {
  kTransient = 0,
  kSucceeded = 1,
  kFailed    = 2,
};

InstanceHealth Classify(const model::Instance& instance);

enum class HealthState : std::uint8_t {
  kWaiting   = 0,
  kConverged = 1,
  kErrored   = 2,
};

struct HealthVerdict {
  HealthState              state{HealthState::kWaiting};
  std::uint32_t            succeeded{0};
  std::uint32_t            failed{0};
  std::uint32_t            transient{0};
  std::vector<std::string> failed_instances;
  std::vector<std::string> terminating_instances;
};

/*
  HealthStateMachine

  Level-triggered: every snapshot is evaluated from scratch, nothing carries
  over between ticks. Only instances of this deployment already running the
  expected build are considered; old-build instances are expected to go away.

  The target resolves once succeeded + failed == desired replicas, as Errored
  if any of them failed. Transient instances (Pending, ContainerCreating,
  Terminating, anything unknown) never count, so a new-build instance stuck in
  Terminating keeps the target waiting until the global deadline.
*/
class HealthStateMachine {
 public:
  explicit HealthStateMachine(model::RolloutTarget target);

  HealthVerdict Evaluate(const std::vector<model::Instance>& snapshot) const;

  const model::RolloutTarget& Target() const {
    return target_;
  }

 private:
  bool Matches(const model::Instance& instance) const;

  model::RolloutTarget target_;
};

} // namespace kuberoll::rollout
