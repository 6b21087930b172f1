#include "kubectl_commands.hpp"

#include <utility>

namespace kuberoll::cluster {

KubectlCommands::KubectlCommands(const kuberoll::runtime::config::ClusterConfig& config)
    : kubectl_(config.kubectl_path().empty() ? "kubectl" : config.kubectl_path()) {
  if (!config.kubeconfig().empty()) {
    qualifiers_.push_back("--kubeconfig=" + config.kubeconfig());
  }
  if (!config.namespace_name().empty()) {
    qualifiers_.push_back("--namespace=" + config.namespace_name());
  }
}

exec::Command KubectlCommands::Make(std::vector<std::string> args) const {
  exec::Command command;
  command.argv.reserve(args.size() + qualifiers_.size() + 1);
  command.argv.push_back(kubectl_);
  for (auto& arg : args) {
    command.argv.push_back(std::move(arg));
  }
  command.argv.insert(command.argv.end(), qualifiers_.begin(), qualifiers_.end());
  return command;
}

exec::Command KubectlCommands::ListInstances() const {
  return Make({"get", "pods"});
}

exec::Command KubectlCommands::ListDeployments() const {
  return Make({"get", "deployments"});
}

exec::Command KubectlCommands::GetManifest(const std::string& deployment) const {
  return Make({"get", "deployment", deployment, "-o", "yaml"});
}

exec::Command KubectlCommands::ReplaceManifest(std::string manifest) const {
  auto command       = Make({"replace", "-f", "-"});
  command.stdin_data = std::move(manifest);
  return command;
}

exec::Command KubectlCommands::InstanceImages(const std::vector<std::string>& instance_ids) const {
  std::vector<std::string> args{"get", "pods"};
  args.insert(args.end(), instance_ids.begin(), instance_ids.end());
  args.push_back("--ignore-not-found");
  args.push_back("--no-headers");
  args.push_back("-o");
  args.push_back("custom-columns=NAME:.metadata.name,IMAGE:.spec.containers[*].image");
  return Make(std::move(args));
}

} // namespace kuberoll::cluster
