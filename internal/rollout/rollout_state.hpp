#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/instance.hpp"
#include "internal/model/rollout_target.hpp"
#include "internal/util/time.hpp"

namespace kuberoll::rollout {

/*
  RolloutState

  Everything the rollout shares across targets: the active targets, one
  snapshot listener per health-checked target, the aggregate error flag, the
  poll start time and the outcomes recorded so far.

  Owned by the orchestrator and only touched from the event loop thread.
  A target leaves the active set exactly once (Resolve) and is never re-added.
*/
class RolloutState {
 public:
  using Listener = std::function<void(const std::vector<model::Instance>& snapshot)>;

  // Returns false when the name is already active or has already resolved.
  bool Activate(const model::RolloutTarget& target);
  bool IsActive(const std::string& name) const;

  // Ignored unless the target is active.
  void                     Listen(const std::string& name, Listener listener);
  bool                     IsListening(const std::string& name) const;
  std::vector<std::string> ListenerNames() const;

  // Deliver a snapshot to one listener if it is still registered.
  void Notify(const std::string& name, const std::vector<model::Instance>& snapshot);

  // Removes the target and its listener and records the outcome. Failure
  // outcomes raise the error flag. No-op for names that are not active.
  void Resolve(model::TargetOutcome outcome);

  // Outcome for an input that never became a target (report mode, skipped).
  void Record(model::TargetOutcome outcome);

  std::vector<std::string>    ActiveNames() const;
  const model::RolloutTarget* FindActive(const std::string& name) const;
  std::size_t                 ActiveCount() const;
  bool                        Empty() const;

  void MarkError() {
    has_errors_ = true;
  }

  bool HasErrors() const {
    return has_errors_;
  }

  void MarkStarted(util::TimePoint now);

  std::optional<util::TimePoint> StartedAt() const {
    return started_at_;
  }

  const std::vector<model::TargetOutcome>& Outcomes() const {
    return outcomes_;
  }

 private:
  std::map<std::string, model::RolloutTarget> active_;
  std::map<std::string, Listener>             listeners_;
  std::vector<std::string>                    resolved_;
  std::vector<model::TargetOutcome>           outcomes_;
  std::optional<util::TimePoint>              started_at_;
  bool                                        has_errors_{false};
};

} // namespace kuberoll::rollout
