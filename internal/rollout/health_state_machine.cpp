#include "health_state_machine.hpp"

#include <utility>

namespace kuberoll::rollout {

InstanceHealth Classify(const model::Instance& instance) {
  if (instance.state == model::LifecycleState::kRunning && instance.ready) {
    return InstanceHealth::kSucceeded;
  }
  if (model::IsHardFailure(instance.state)) {
    return InstanceHealth::kFailed;
  }
  return InstanceHealth::kTransient;
}

HealthStateMachine::HealthStateMachine(model::RolloutTarget target) : target_(std::move(target)) {
}

bool HealthStateMachine::Matches(const model::Instance& instance) const {
  return instance.name == target_.Name() && instance.build && *instance.build == target_.expected_build;
}

HealthVerdict HealthStateMachine::Evaluate(const std::vector<model::Instance>& snapshot) const {
  HealthVerdict verdict;

  for (const auto& instance : snapshot) {
    if (!Matches(instance)) continue;

    switch (Classify(instance)) {
      case InstanceHealth::kSucceeded:
        ++verdict.succeeded;
        break;
      case InstanceHealth::kFailed:
        ++verdict.failed;
        verdict.failed_instances.push_back(instance.id + " (" + instance.status + ")");
        break;
      case InstanceHealth::kTransient:
        ++verdict.transient;
        if (instance.state == model::LifecycleState::kTerminating) {
          verdict.terminating_instances.push_back(instance.id);
        }
        break;
    }
  }

  if (verdict.succeeded + verdict.failed == target_.deployment.desired_replicas) {
    verdict.state = verdict.failed > 0 ? HealthState::kErrored : HealthState::kConverged;
  }

  return verdict;
}

} // namespace kuberoll::rollout
