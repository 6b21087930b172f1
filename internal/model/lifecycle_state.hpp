#pragma once

#include <cstdint>
#include <string_view>

namespace kuberoll::model {

enum class LifecycleState : std::uint8_t {
  kUnknown           = 0,
  kPending           = 1,
  kContainerCreating = 2,
  kRunning           = 3,
  kTerminating       = 4,
  kCrashLoopBackOff  = 5,
  kError             = 6,
};

constexpr bool IsHardFailure(LifecycleState state) {
  return state == LifecycleState::kError || state == LifecycleState::kCrashLoopBackOff;
}

// Anything that is neither running nor a hard failure. Includes Terminating,
// so an instance stuck terminating holds its target open until the deadline.
constexpr bool IsTransient(LifecycleState state) {
  return state != LifecycleState::kRunning && !IsHardFailure(state);
}

constexpr LifecycleState ParseLifecycleState(std::string_view status) {
  if (status == "Running") return LifecycleState::kRunning;
  if (status == "Pending") return LifecycleState::kPending;
  if (status == "ContainerCreating") return LifecycleState::kContainerCreating;
  if (status == "Terminating") return LifecycleState::kTerminating;
  if (status == "CrashLoopBackOff") return LifecycleState::kCrashLoopBackOff;
  if (status == "Error") return LifecycleState::kError;
  return LifecycleState::kUnknown;
}

} // namespace kuberoll::model
