#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/exec/command_runner.hpp"
#include "internal/rollout/rollout_orchestrator.hpp"
#include "internal/util/time.hpp"

namespace kuberoll::factory {

/*
  Application

  Owns everything one run needs. The orchestrator holds the clock and runner
  through shared ownership; they are kept here as well so the caller can
  reach them.
*/
struct Application {
  std::shared_ptr<util::TimeSource>             clock;
  exec::CommandRunnerPtr                        runner;
  std::unique_ptr<rollout::RolloutOrchestrator> orchestrator;
};

/*
  Build

  Composition root: the only place that picks the real clock and the real
  process runner. Tests construct RolloutOrchestrator directly with fakes.
*/
Application Build(const kuberoll::runtime::config::RuntimeConfig& config);

} // namespace kuberoll::factory
