#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/exec/command_runner.hpp"

namespace kuberoll::cluster {

/*
  Builds the kubectl invocations the rollout needs. The configured context
  qualifiers (--kubeconfig, --namespace) are appended to every command.
*/
class KubectlCommands {
 public:
  explicit KubectlCommands(const kuberoll::runtime::config::ClusterConfig& config);

  exec::Command ListInstances() const;
  exec::Command ListDeployments() const;
  exec::Command GetManifest(const std::string& deployment) const;
  exec::Command ReplaceManifest(std::string manifest) const;

  // One "<id> <images>" row per instance, in whatever order the API returns.
  // Instances deleted since the listing are silently left out.
  exec::Command InstanceImages(const std::vector<std::string>& instance_ids) const;

 private:
  exec::Command Make(std::vector<std::string> args) const;

  std::string              kubectl_;
  std::vector<std::string> qualifiers_;
};

} // namespace kuberoll::cluster
