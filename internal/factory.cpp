#include "factory.hpp"

#include "internal/observability/logging.hpp"

namespace kuberoll::factory {

using kuberoll::observability::IntField;
using kuberoll::observability::StringField;

Application Build(const kuberoll::runtime::config::RuntimeConfig& config) {
  Application app;
  app.clock        = std::make_shared<util::SteadyTimeSource>();
  app.runner       = std::make_shared<exec::ProcessCommandRunner>();
  app.orchestrator = std::make_unique<rollout::RolloutOrchestrator>(config, app.clock, app.runner);

  KUBEROLL_LOG_DEBUG("Runtime built", {StringField("kubectl", config.cluster().kubectl_path()),
                                       IntField("max_attempts", config.retry().max_attempts()), IntField("retry_delay_ms", config.retry().delay_ms()),
                                       IntField("poll_interval_ms", config.poll().interval_ms()),
                                       IntField("timeout_seconds", config.poll().timeout_seconds())});
  return app;
}

} // namespace kuberoll::factory
