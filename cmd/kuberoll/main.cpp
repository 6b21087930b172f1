#include <iostream>
#include <string>
#include <vector>

#include "internal/config/arguments.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/rollout/target_resolver.hpp"
#include "internal/util/errors.hpp"

using kuberoll::observability::IntField;
using kuberoll::observability::StringField;

static void LogOutcome(const kuberoll::model::TargetOutcome& outcome) {
  const auto status = std::string(kuberoll::model::ToString(outcome.status));
  if (kuberoll::model::IsFailure(outcome.status)) {
    KUBEROLL_LOG_ERROR("Target failed", {StringField("deployment", outcome.name), StringField("status", status),
                                         StringField("build", outcome.build), IntField("succeeded", outcome.succeeded),
                                         IntField("failed", outcome.failed), StringField("reason", outcome.message)});
    return;
  }
  KUBEROLL_LOG_INFO("Target done", {StringField("deployment", outcome.name), StringField("status", status), StringField("build", outcome.build)});
}

static void Shutdown() {
  kuberoll::observability::ShutdownTracing();
  kuberoll::observability::ShutdownLogging();
}

int main(int argc, char** argv) {
  kuberoll::config::Invocation invocation;
  try {
    invocation = kuberoll::config::ParseArguments(argc, argv);
  } catch (const kuberoll::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n\n" << kuberoll::config::Usage();
    return 2;
  }

  if (invocation.help) {
    std::cout << kuberoll::config::Usage();
    return 0;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = invocation.config_path.empty() ? kuberoll::config::ConfigLoader::Defaults()
                                                 : kuberoll::config::ConfigLoader::LoadFromYaml(invocation.config_path);
    kuberoll::config::ApplyOverrides(invocation, &config);

    kuberoll::observability::InitializeLogging(config);
    kuberoll::observability::InitializeTracing(config);

    if (!config.cluster().kubeconfig().empty()) {
      KUBEROLL_LOG_INFO("Using config", {StringField("kubeconfig", config.cluster().kubeconfig())});
    }
    if (!config.cluster().namespace_name().empty()) {
      KUBEROLL_LOG_INFO("Using namespace", {StringField("namespace", config.cluster().namespace_name())});
    }

    std::vector<kuberoll::rollout::TargetRequest> requests;
    for (const auto& target : invocation.targets) {
      requests.push_back(kuberoll::rollout::ParseTargetRequest(target));
    }

    // ------------------------------------------------------------
    // Run the rollout
    // ------------------------------------------------------------
    auto app    = kuberoll::factory::Build(config);
    auto report = app.orchestrator->Run(requests);

    for (const auto& outcome : report.outcomes) {
      LogOutcome(outcome);
    }
    if (report.aborted) {
      KUBEROLL_LOG_ERROR("Rollout aborted", {StringField("reason", report.abort_reason)});
    }

    Shutdown();
    return report.success ? 0 : 1;
  } catch (const std::exception& e) {
    KUBEROLL_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }
}
