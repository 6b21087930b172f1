#include "convergence_poller.hpp"

#include <set>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/strings.hpp"

namespace kuberoll::rollout {

using kuberoll::observability::IntField;
using kuberoll::observability::StringField;

ConvergencePoller::ConvergencePoller(runtime::EventLoop& loop, cluster::ClusterClient& client, RolloutState& state,
                                     const kuberoll::runtime::config::PollConfig& config, TimeoutHandler on_timeout)
    : loop_(loop),
      client_(client),
      state_(state),
      interval_(config.interval_ms()),
      timeout_(std::chrono::seconds(config.timeout_seconds())),
      on_timeout_(std::move(on_timeout)) {
}

void ConvergencePoller::Watch(const model::RolloutTarget& target) {
  if (!state_.IsActive(target.Name())) return;

  auto machine = std::make_shared<HealthStateMachine>(target);
  state_.Listen(target.Name(), [this, machine](const std::vector<model::Instance>& snapshot) { OnSnapshot(*machine, snapshot); });

  state_.MarkStarted(loop_.Now());
  if (!running_) {
    running_ = true;
    ScheduleTick();
  }
}

void ConvergencePoller::ScheduleTick() {
  loop_.PostDelayed(interval_, [this] { Tick(); });
}

void ConvergencePoller::Tick() {
  if (state_.Empty()) {
    running_ = false;
    return;
  }

  const auto elapsed_ms = util::ElapsedMillis(*state_.StartedAt(), loop_.Now());
  if (elapsed_ms > timeout_.count()) {
    Expire(elapsed_ms);
    return;
  }

  client_.ListInstances([this](std::vector<model::Instance> instances) {
    const auto                  names = state_.ActiveNames();
    const std::set<std::string> active(names.begin(), names.end());

    std::vector<model::Instance> relevant;
    for (auto& instance : instances) {
      if (active.count(instance.name)) relevant.push_back(std::move(instance));
    }

    client_.ResolveBuilds(std::move(relevant), [this](std::vector<model::Instance> snapshot) {
      Dispatch(snapshot);

      if (state_.Empty()) {
        running_ = false;
        KUBEROLL_LOG_DEBUG("All rollout targets resolved, polling stopped");
        return;
      }
      ScheduleTick();
    });
  });
}

void ConvergencePoller::Dispatch(const std::vector<model::Instance>& snapshot) {
  observability::SpanScope span("kuberoll.poll_tick");
  span.SetAttribute("instances", static_cast<std::int64_t>(snapshot.size()));
  span.SetAttribute("targets", static_cast<std::int64_t>(state_.ActiveCount()));

  // Listeners deregister themselves while we iterate; Notify skips names that
  // are gone by the time their turn comes.
  for (const auto& name : state_.ListenerNames()) {
    state_.Notify(name, snapshot);
  }
}

void ConvergencePoller::Expire(std::int64_t elapsed_ms) {
  timed_out_ = true;
  running_   = false;

  const auto unresolved = state_.ActiveNames();
  KUBEROLL_LOG_ERROR("Timed out waiting for deployments to converge",
                     {StringField("deployments", util::Join(unresolved, ", ")), IntField("elapsed_ms", elapsed_ms)});

  for (const auto& name : unresolved) {
    const auto* target = state_.FindActive(name);

    model::TargetOutcome outcome;
    outcome.name    = name;
    outcome.status  = model::OutcomeStatus::kTimedOut;
    outcome.build   = target ? target->expected_build : std::string{};
    outcome.message = "did not converge within " + std::to_string(timeout_.count() / 1000) + "s";
    state_.Resolve(std::move(outcome));
  }

  if (on_timeout_) on_timeout_(unresolved);
}

void ConvergencePoller::OnSnapshot(const HealthStateMachine& machine, const std::vector<model::Instance>& snapshot) {
  const auto& target  = machine.Target();
  const auto  verdict = machine.Evaluate(snapshot);

  if (verdict.state == HealthState::kWaiting) {
    KUBEROLL_LOG_DEBUG("Waiting for deployment", {StringField("deployment", target.Name()), StringField("build", target.expected_build),
                                                  IntField("succeeded", verdict.succeeded), IntField("failed", verdict.failed),
                                                  IntField("transient", verdict.transient),
                                                  IntField("desired", target.deployment.desired_replicas)});
    if (!verdict.terminating_instances.empty()) {
      KUBEROLL_LOG_DEBUG("Instances on the new build are terminating",
                         {StringField("deployment", target.Name()), StringField("instances", util::Join(verdict.terminating_instances, ", "))});
    }
    return;
  }

  model::TargetOutcome outcome;
  outcome.name      = target.Name();
  outcome.build     = target.expected_build;
  outcome.succeeded = verdict.succeeded;
  outcome.failed    = verdict.failed;

  if (verdict.state == HealthState::kConverged) {
    outcome.status = model::OutcomeStatus::kConverged;
    KUBEROLL_LOG_INFO("Deployment has been restarted and is now running the new build",
                      {StringField("deployment", target.Name()), StringField("build", target.expected_build),
                       IntField("instances", verdict.succeeded)});
  } else {
    outcome.status  = model::OutcomeStatus::kErrored;
    outcome.message = "failed instances: " + util::Join(verdict.failed_instances, ", ");
    KUBEROLL_LOG_ERROR("Deployment has failing instances on the new build",
                       {StringField("deployment", target.Name()), StringField("build", target.expected_build),
                        IntField("succeeded", verdict.succeeded), IntField("failed", verdict.failed),
                        StringField("instances", util::Join(verdict.failed_instances, ", "))});
  }

  state_.Resolve(std::move(outcome));
}

} // namespace kuberoll::rollout
