#include "rollout_state.hpp"

#include <algorithm>
#include <utility>

namespace kuberoll::rollout {

bool RolloutState::Activate(const model::RolloutTarget& target) {
  const auto& name = target.Name();
  if (std::find(resolved_.begin(), resolved_.end(), name) != resolved_.end()) {
    return false;
  }
  return active_.emplace(name, target).second;
}

bool RolloutState::IsActive(const std::string& name) const {
  return active_.count(name) > 0;
}

void RolloutState::Listen(const std::string& name, Listener listener) {
  if (!IsActive(name)) return;
  listeners_[name] = std::move(listener);
}

bool RolloutState::IsListening(const std::string& name) const {
  return listeners_.count(name) > 0;
}

std::vector<std::string> RolloutState::ListenerNames() const {
  std::vector<std::string> names;
  names.reserve(listeners_.size());
  for (const auto& [name, listener] : listeners_) {
    names.push_back(name);
  }
  return names;
}

void RolloutState::Notify(const std::string& name, const std::vector<model::Instance>& snapshot) {
  auto it = listeners_.find(name);
  if (it == listeners_.end()) return;

  // The listener may resolve itself, which erases it from the map.
  auto listener = it->second;
  listener(snapshot);
}

void RolloutState::Resolve(model::TargetOutcome outcome) {
  auto it = active_.find(outcome.name);
  if (it == active_.end()) return;

  active_.erase(it);
  listeners_.erase(outcome.name);
  resolved_.push_back(outcome.name);
  Record(std::move(outcome));
}

void RolloutState::Record(model::TargetOutcome outcome) {
  if (model::IsFailure(outcome.status)) {
    has_errors_ = true;
  }
  outcomes_.push_back(std::move(outcome));
}

std::vector<std::string> RolloutState::ActiveNames() const {
  std::vector<std::string> names;
  names.reserve(active_.size());
  for (const auto& [name, target] : active_) {
    names.push_back(name);
  }
  return names;
}

const model::RolloutTarget* RolloutState::FindActive(const std::string& name) const {
  auto it = active_.find(name);
  return it == active_.end() ? nullptr : &it->second;
}

std::size_t RolloutState::ActiveCount() const {
  return active_.size();
}

bool RolloutState::Empty() const {
  return active_.empty();
}

void RolloutState::MarkStarted(util::TimePoint now) {
  if (!started_at_) started_at_ = now;
}

} // namespace kuberoll::rollout
