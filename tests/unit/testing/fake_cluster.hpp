#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/inventory/build_extractor.hpp"
#include "scripted_command_runner.hpp"

namespace kuberoll::testing {

struct FakePod {
  std::string id;
  std::string status;
  bool        ready{false};
  std::string build;
};

/*
  In-memory cluster answering the kubectl commands of an unqualified
  KubectlCommands ("kubectl get pods", "kubectl replace -f -", ...).

  Each `kubectl get pods` listing consumes the next snapshot of the pod
  timeline; the last snapshot repeats forever. Applied manifests change the
  deployment's build as seen by later manifest fetches.

  Failures are injected through Runner() using the exact command line, which
  overrides the built-in answer.
*/
class FakeCluster {
 public:
  FakeCluster() : runner_(std::make_shared<ScriptedCommandRunner>()) {
    runner_->On("kubectl get deployments", [this](const exec::Command&) { return Listing(DeploymentsTable()); });
    runner_->On("kubectl get pods", [this](const exec::Command&) { return Listing(PodsTable()); });
    runner_->On("custom-columns=", [this](const exec::Command& command) { return Ok(ImagesTable(command)); });
    runner_->On("kubectl get deployment ", [this](const exec::Command& command) { return Ok(Manifest(command.argv.at(3))); });
    runner_->On("kubectl replace -f -", [this](const exec::Command& command) { return Replace(command); });
  }

  FakeCluster(const FakeCluster&)            = delete;
  FakeCluster& operator=(const FakeCluster&) = delete;

  // `last_applied` is the build recorded in the last-applied-configuration
  // annotation; it defaults to `build` and, as with kubectl replace, is never
  // updated by an applied manifest.
  void AddDeployment(const std::string& name, std::uint32_t desired, const std::string& build, std::string last_applied = {}) {
    if (last_applied.empty()) last_applied = build;
    deployments_[name] = {desired, build, std::move(last_applied)};
  }

  void AddPodSnapshot(std::vector<FakePod> pods) {
    timeline_.push_back(std::move(pods));
  }

  std::optional<std::string> BuildOf(const std::string& deployment) const {
    auto it = deployments_.find(deployment);
    if (it == deployments_.end()) return std::nullopt;
    return it->second.build;
  }

  const std::vector<std::string>& AppliedManifests() const {
    return applied_;
  }

  std::shared_ptr<ScriptedCommandRunner> Runner() const {
    return runner_;
  }

  static std::string ImageFor(const std::string& deployment, const std::string& build) {
    return "registry.example.com:5000/team/" + deployment + ":build-" + build;
  }

 private:
  struct DeploymentSpec {
    std::uint32_t desired{0};
    std::string   build;
    std::string   last_applied;
  };

  static exec::CommandResult Ok(std::string stdout_text) {
    exec::CommandResult result;
    result.stdout_text = std::move(stdout_text);
    return result;
  }

  // kubectl answers an empty listing on stderr with exit code 0.
  static exec::CommandResult Listing(std::string table) {
    if (table.find('\n') + 1 == table.size()) {
      exec::CommandResult result;
      result.stderr_text = "No resources found in default namespace.\n";
      return result;
    }
    return Ok(std::move(table));
  }

  static std::string OwnerOf(const std::string& pod_id) {
    const auto last = pod_id.rfind('-');
    const auto hash = pod_id.rfind('-', last - 1);
    return pod_id.substr(0, hash);
  }

  std::string DeploymentsTable() const {
    std::string table = "NAME   READY   UP-TO-DATE   AVAILABLE   AGE\n";
    for (const auto& [name, spec] : deployments_) {
      table += name + "   " + std::to_string(spec.desired) + "/" + std::to_string(spec.desired) + "   " + std::to_string(spec.desired) +
               "   " + std::to_string(spec.desired) + "   12d\n";
    }
    return table;
  }

  const std::vector<FakePod>& CurrentPods() const {
    static const std::vector<FakePod> kNone;
    if (timeline_.empty()) return kNone;
    const auto index = listing_ == 0 ? 0 : std::min(listing_, timeline_.size()) - 1;
    return timeline_[index];
  }

  std::string PodsTable() {
    ++listing_;
    std::string table = "NAME   READY   STATUS   RESTARTS   AGE\n";
    for (const auto& pod : CurrentPods()) {
      table += pod.id + "   " + (pod.ready ? "1/1" : "0/1") + "   " + pod.status + "   0   1m\n";
    }
    return table;
  }

  std::string ImagesTable(const exec::Command& command) const {
    std::string table;
    for (std::size_t i = 3; i < command.argv.size() && command.argv[i].rfind("--", 0) != 0; ++i) {
      for (const auto& pod : CurrentPods()) {
        if (pod.id == command.argv[i]) {
          table += pod.id + "   " + ImageFor(OwnerOf(pod.id), pod.build) + "\n";
        }
      }
    }
    return table;
  }

  std::string Manifest(const std::string& deployment) const {
    auto it = deployments_.find(deployment);
    if (it == deployments_.end()) return {};

    return "apiVersion: apps/v1\n"
           "kind: Deployment\n"
           "metadata:\n"
           "  annotations:\n"
           "    deployment.kubernetes.io/revision: \"3\"\n"
           "    kubectl.kubernetes.io/last-applied-configuration: |\n"
           "      {\"apiVersion\":\"apps/v1\",\"kind\":\"Deployment\",\"metadata\":{\"annotations\":{},\"name\":\"" + deployment +
           "\"},\"spec\":{\"template\":{\"spec\":{\"containers\":[{\"image\":\"" + ImageFor(deployment, it->second.last_applied) +
           "\",\"name\":\"" + deployment + "\"}]}}}}\n"
           "  name: " + deployment + "\n"
           "spec:\n"
           "  replicas: " + std::to_string(it->second.desired) + "\n"
           "  template:\n"
           "    spec:\n"
           "      containers:\n"
           "      - name: " + deployment + "\n"
           "        image: " + ImageFor(deployment, it->second.build) + "\n";
  }

  exec::CommandResult Replace(const exec::Command& command) {
    applied_.push_back(command.stdin_data);

    const auto build = inventory::ExtractManifestBuild(command.stdin_data);
    for (auto& [name, spec] : deployments_) {
      if (command.stdin_data.find("  name: " + name + "\n") != std::string::npos && build) {
        spec.build = *build;
      }
    }
    return Ok("deployment.apps/replaced\n");
  }

  std::shared_ptr<ScriptedCommandRunner> runner_;
  std::map<std::string, DeploymentSpec>  deployments_;
  std::vector<std::vector<FakePod>>      timeline_;
  std::size_t                            listing_{0};
  std::vector<std::string>               applied_;
};

} // namespace kuberoll::testing
