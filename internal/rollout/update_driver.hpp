#pragma once

#include <string>

#include "internal/cluster/cluster_client.hpp"
#include "internal/model/rollout_target.hpp"
#include "internal/rollout/convergence_poller.hpp"
#include "internal/rollout/rollout_state.hpp"

namespace kuberoll::rollout {

/*
  UpdateDriver

  Rewrites a deployment's image to `build-<expected build>` with a single
  retried unit: get manifest, rewrite the first image tag, replace manifest.
  A failed replace retries from the fetch, which is safe because the rewrite
  is idempotent for a fixed build.

  Accepted -> the target is handed to the poller.
  Retries exhausted -> the target resolves as mutation-failed without ever
  being polled; other targets are unaffected.
*/
class UpdateDriver {
 public:
  UpdateDriver(cluster::ClusterClient& client, RolloutState& state, ConvergencePoller& poller);

  // `target` must already be active in the rollout state.
  void UpdateDeployment(const model::RolloutTarget& target, const std::string& original_build);

 private:
  cluster::ClusterClient& client_;
  RolloutState&           state_;
  ConvergencePoller&      poller_;
};

} // namespace kuberoll::rollout
