#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/cluster/cluster_client.hpp"
#include "internal/rollout/health_state_machine.hpp"
#include "internal/rollout/rollout_state.hpp"
#include "internal/runtime/event_loop.hpp"

namespace kuberoll::rollout {

/*
  ConvergencePoller

  One polling loop shared by every target of the run. Started by the first
  Watch(); the deadline is measured from that moment. Each tick:

    1. past the deadline -> every active target is resolved as timed out and
       the timeout handler aborts the run;
    2. one `get pods` for all active targets, one batched image query for the
       matching instances;
    3. the snapshot goes to every registered listener;
    4. the loop stops once no target is active, otherwise the next tick is
       scheduled one interval later.
*/
class ConvergencePoller {
 public:
  using TimeoutHandler = std::function<void(const std::vector<std::string>& unresolved)>;

  ConvergencePoller(runtime::EventLoop& loop, cluster::ClusterClient& client, RolloutState& state,
                    const kuberoll::runtime::config::PollConfig& config, TimeoutHandler on_timeout);

  // Registers a health check for an active target and starts the loop if it
  // is not already ticking.
  void Watch(const model::RolloutTarget& target);

  bool Running() const {
    return running_;
  }

  bool TimedOut() const {
    return timed_out_;
  }

  util::Duration Interval() const {
    return interval_;
  }

  util::Duration Timeout() const {
    return timeout_;
  }

 private:
  void ScheduleTick();
  void Tick();
  void Dispatch(const std::vector<model::Instance>& snapshot);
  void Expire(std::int64_t elapsed_ms);
  void OnSnapshot(const HealthStateMachine& machine, const std::vector<model::Instance>& snapshot);

  runtime::EventLoop&     loop_;
  cluster::ClusterClient& client_;
  RolloutState&           state_;
  util::Duration          interval_;
  util::Duration          timeout_;
  TimeoutHandler          on_timeout_;
  bool                    running_{false};
  bool                    timed_out_{false};
};

} // namespace kuberoll::rollout
