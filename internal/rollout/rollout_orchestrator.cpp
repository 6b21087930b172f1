#include "rollout_orchestrator.hpp"

#include <utility>

#include "internal/inventory/build_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace kuberoll::rollout {

using kuberoll::observability::BoolField;
using kuberoll::observability::IntField;
using kuberoll::observability::StringField;

namespace {

std::string DescribeInstance(const model::Instance& instance) {
  std::string description = instance.ready ? "Ready" : "Not ready";
  description += ", " + instance.status;
  description += ", " + std::to_string(instance.restarts) + " restarts";
  return description;
}

} // namespace

RolloutOrchestrator::RolloutOrchestrator(const kuberoll::runtime::config::RuntimeConfig& config, std::shared_ptr<util::TimeSource> clock,
                                         exec::CommandRunnerPtr runner)
    : loop_(std::move(clock)),
      gateway_(loop_, std::move(runner), config.retry(), [this](const exec::QueryFailure& failure) { Abort(failure.Describe()); }),
      client_(gateway_, cluster::KubectlCommands(config.cluster())),
      poller_(loop_, client_, state_, config.poll(),
              [this](const std::vector<std::string>&) { loop_.Stop(); }),
      driver_(client_, state_, poller_) {
}

RolloutReport RolloutOrchestrator::Run(const std::vector<TargetRequest>& requests) {
  client_.ListDeployments([this, requests](std::vector<model::Deployment> deployments) {
    client_.ListInstances([this, requests, deployments = std::move(deployments)](std::vector<model::Instance> instances) {
      OnInventory(requests, deployments, instances);
    });
  });

  loop_.Run();

  // Targets still open here were cut off by an abort, or stranded with nothing
  // left to run; neither counts as converged.
  for (const auto& name : state_.ActiveNames()) {
    model::TargetOutcome outcome;
    outcome.name    = name;
    outcome.status  = aborted_ ? model::OutcomeStatus::kErrored : model::OutcomeStatus::kTimedOut;
    outcome.message = aborted_ ? "aborted: " + abort_reason_ : "rollout stalled";
    state_.Resolve(std::move(outcome));
  }

  RolloutReport report;
  report.timed_out    = poller_.TimedOut();
  report.aborted      = aborted_;
  report.abort_reason = abort_reason_;
  report.outcomes     = state_.Outcomes();
  report.success      = !aborted_ && !report.timed_out && !state_.HasErrors();

  KUBEROLL_LOG_INFO("Rollout finished", {BoolField("success", report.success), IntField("targets", report.outcomes.size())});
  return report;
}

void RolloutOrchestrator::OnInventory(const std::vector<TargetRequest>& requests, const std::vector<model::Deployment>& deployments,
                                      const std::vector<model::Instance>& instances) {
  for (const auto& request : requests) {
    model::Deployment deployment;
    try {
      deployment = ResolveDeployment(request.input, deployments);
    } catch (const util::NotFound& e) {
      KUBEROLL_LOG_ERROR(e.what());
      state_.Record({request.input, model::OutcomeStatus::kSkipped, request.build.value_or(""), 0, 0, e.what()});
      continue;
    } catch (const util::AmbiguousMatch& e) {
      KUBEROLL_LOG_ERROR(e.what());
      state_.Record({request.input, model::OutcomeStatus::kSkipped, request.build.value_or(""), 0, 0, e.what()});
      continue;
    }

    std::vector<model::Instance> owned;
    for (const auto& instance : instances) {
      if (instance.name == deployment.name) owned.push_back(instance);
    }
    BeginTarget(request, deployment, std::move(owned));
  }
}

void RolloutOrchestrator::BeginTarget(const TargetRequest& request, const model::Deployment& deployment,
                                      std::vector<model::Instance> instances) {
  client_.GetManifest(
      deployment.name,
      [this, request, deployment, instances = std::move(instances)](const std::string& manifest) mutable {
        const auto build = inventory::ExtractManifestBuild(manifest);
        if (!build) {
          const auto message = "Cannot get build number for deployment " + deployment.name;
          KUBEROLL_LOG_ERROR(message);
          state_.Record({deployment.name, model::OutcomeStatus::kErrored, request.build.value_or(""), 0, 0, message});
          return;
        }

        if (!request.build) {
          ReportTarget(deployment, *build, std::move(instances));
          return;
        }

        model::RolloutTarget target{deployment, *request.build};
        if (!state_.Activate(target)) {
          KUBEROLL_LOG_WARN("Deployment requested more than once, ignoring repeat", {StringField("deployment", deployment.name)});
          return;
        }

        if (*build == *request.build) {
          KUBEROLL_LOG_INFO("Deployment is already on the requested build, checking its instances",
                            {StringField("deployment", deployment.name), StringField("build", *build)});
          poller_.Watch(target);
          return;
        }

        driver_.UpdateDeployment(target, *build);
      },
      [this, name = deployment.name](const exec::QueryFailure& failure) { RecordQueryFailure(name, failure); });
}

void RolloutOrchestrator::ReportTarget(const model::Deployment& deployment, const std::string& build, std::vector<model::Instance> instances) {
  KUBEROLL_LOG_INFO("Deployment is on build", {StringField("deployment", deployment.name), StringField("build", build),
                                               IntField("desired_replicas", deployment.desired_replicas)});

  client_.ResolveBuilds(
      std::move(instances),
      [this, deployment, build](std::vector<model::Instance> resolved) {
        for (const auto& instance : resolved) {
          if (!instance.build) {
            KUBEROLL_LOG_WARN("Cannot get build number for instance", {StringField("instance", instance.id)});
            continue;
          }
          KUBEROLL_LOG_INFO("Instance is on build", {StringField("instance", instance.id), StringField("state", DescribeInstance(instance)),
                                                     StringField("build", *instance.build)});
        }
        state_.Record({deployment.name, model::OutcomeStatus::kReported, build, 0, 0, {}});
      },
      [this, name = deployment.name](const exec::QueryFailure& failure) { RecordQueryFailure(name, failure); });
}

void RolloutOrchestrator::RecordQueryFailure(const std::string& name, const exec::QueryFailure& failure) {
  state_.Record({name, model::OutcomeStatus::kErrored, {}, 0, 0, failure.Describe()});
}

void RolloutOrchestrator::Abort(const std::string& reason) {
  if (aborted_) return;

  aborted_      = true;
  abort_reason_ = reason;
  KUBEROLL_LOG_ERROR("Aborting rollout", {StringField("reason", reason), StringField("unresolved", util::Join(state_.ActiveNames(), ", "))});
  loop_.Stop();
}

} // namespace kuberoll::rollout
