#include "update_driver.hpp"

#include <utility>

#include "internal/inventory/build_extractor.hpp"
#include "internal/observability/logging.hpp"

namespace kuberoll::rollout {

using kuberoll::observability::StringField;

UpdateDriver::UpdateDriver(cluster::ClusterClient& client, RolloutState& state, ConvergencePoller& poller)
    : client_(client), state_(state), poller_(poller) {
}

void UpdateDriver::UpdateDeployment(const model::RolloutTarget& target, const std::string& original_build) {
  const auto& name  = target.Name();
  const auto& build = target.expected_build;

  auto operation = [commands = client_.Commands(), name, build](exec::CommandRunner& runner) {
    auto fetched = runner.Run(commands.GetManifest(name));
    if (fetched.Failed()) {
      return fetched;
    }

    auto rewritten = inventory::RewriteBuild(fetched.stdout_text, build);
    if (!rewritten) {
      exec::CommandResult result;
      result.exit_code   = 1;
      result.stderr_text = "no tagged image reference in manifest of " + name;
      return result;
    }

    return runner.Run(commands.ReplaceManifest(std::move(*rewritten)));
  };

  client_.Gateway().RunOperation(
      "update deployment " + name, std::move(operation),
      [this, target, original_build](const std::string&) {
        KUBEROLL_LOG_INFO("Deployment has been updated, waiting for instances to restart",
                          {StringField("deployment", target.Name()), StringField("from_build", original_build),
                           StringField("to_build", target.expected_build)});
        poller_.Watch(target);
      },
      [this, target](const exec::QueryFailure& failure) {
        KUBEROLL_LOG_ERROR("Error while updating deployment",
                           {StringField("deployment", target.Name()), StringField("error", failure.Describe())});

        model::TargetOutcome outcome;
        outcome.name    = target.Name();
        outcome.status  = model::OutcomeStatus::kMutationFailed;
        outcome.build   = target.expected_build;
        outcome.message = failure.Describe();
        state_.Resolve(std::move(outcome));
      });
}

} // namespace kuberoll::rollout
