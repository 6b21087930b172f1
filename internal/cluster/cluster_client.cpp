#include "cluster_client.hpp"

#include <memory>
#include <utility>

#include "internal/inventory/build_extractor.hpp"
#include "internal/inventory/inventory_parser.hpp"
#include "internal/observability/logging.hpp"

namespace kuberoll::cluster {

using kuberoll::observability::StringField;

ClusterClient::ClusterClient(exec::ExecutionGateway& gateway, KubectlCommands commands)
    : gateway_(gateway), commands_(std::move(commands)) {
}

void ClusterClient::ListInstances(InstancesHandler on_done, ErrorHandler on_error) {
  gateway_.Run(
      "get pods", commands_.ListInstances(),
      [on_done = std::move(on_done)](const std::string& output) { on_done(inventory::ParseInstances(output)); }, std::move(on_error));
}

void ClusterClient::ListDeployments(DeploymentsHandler on_done, ErrorHandler on_error) {
  gateway_.Run(
      "get deployments", commands_.ListDeployments(),
      [on_done = std::move(on_done)](const std::string& output) { on_done(inventory::ParseDeployments(output)); }, std::move(on_error));
}

void ClusterClient::GetManifest(const std::string& deployment, ManifestHandler on_done, ErrorHandler on_error) {
  gateway_.Run("get deployment " + deployment, commands_.GetManifest(deployment), std::move(on_done), std::move(on_error));
}

void ClusterClient::ResolveBuilds(std::vector<model::Instance> instances, InstancesHandler on_done, ErrorHandler on_error) {
  if (instances.empty()) {
    on_done(std::move(instances));
    return;
  }

  std::vector<std::string> ids;
  ids.reserve(instances.size());
  for (const auto& instance : instances) {
    ids.push_back(instance.id);
  }

  auto pending = std::make_shared<std::vector<model::Instance>>(std::move(instances));
  gateway_.Run(
      "get pod images", commands_.InstanceImages(ids),
      [pending, on_done = std::move(on_done)](const std::string& output) {
        const auto builds = inventory::ParseInstanceBuilds(output);
        for (auto& instance : *pending) {
          auto it = builds.find(instance.id);
          if (it != builds.end() && it->second) {
            instance.build = *it->second;
            continue;
          }
          KUBEROLL_LOG_DEBUG("Cannot get build number for instance", {StringField("instance", instance.id)});
        }
        on_done(std::move(*pending));
      },
      std::move(on_error));
}

} // namespace kuberoll::cluster
