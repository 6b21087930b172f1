#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/cluster/cluster_client.hpp"
#include "internal/exec/execution_gateway.hpp"
#include "internal/model/rollout_target.hpp"
#include "internal/rollout/convergence_poller.hpp"
#include "internal/rollout/rollout_state.hpp"
#include "internal/rollout/target_resolver.hpp"
#include "internal/rollout/update_driver.hpp"
#include "internal/runtime/event_loop.hpp"

namespace kuberoll::rollout {

struct RolloutReport {
  bool                              success{false};
  bool                              timed_out{false};
  bool                              aborted{false};
  std::string                       abort_reason;
  std::vector<model::TargetOutcome> outcomes;
};

/*
  RolloutOrchestrator

  Composition of one run: event loop, gateway, cluster client, rollout
  state, poller and update driver, all owned here and wired by reference.

  Run() lists deployments and instances once, resolves every request against
  them, then per target either reports it, health-checks it in place (already
  on the requested build) or updates it. It returns when the event loop has
  drained: every target resolved, the deadline fired, or a query without an
  error handler exhausted its retries.

  One orchestrator runs once.
*/
class RolloutOrchestrator {
 public:
  RolloutOrchestrator(const kuberoll::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock,
                      exec::CommandRunnerPtr runner);

  RolloutOrchestrator(const RolloutOrchestrator&)            = delete;
  RolloutOrchestrator& operator=(const RolloutOrchestrator&) = delete;

  RolloutReport Run(const std::vector<TargetRequest>& requests);

 private:
  void OnInventory(const std::vector<TargetRequest>& requests, const std::vector<model::Deployment>& deployments,
                   const std::vector<model::Instance>& instances);
  void BeginTarget(const TargetRequest& request, const model::Deployment& deployment, std::vector<model::Instance> instances);
  void ReportTarget(const model::Deployment& deployment, const std::string& build, std::vector<model::Instance> instances);
  void RecordQueryFailure(const std::string& name, const exec::QueryFailure& failure);
  void Abort(const std::string& reason);

  runtime::EventLoop     loop_;
  exec::ExecutionGateway gateway_;
  cluster::ClusterClient client_;
  RolloutState           state_;
  ConvergencePoller      poller_;
  UpdateDriver           driver_;
  bool                   aborted_{false};
  std::string            abort_reason_;
};

} // namespace kuberoll::rollout
