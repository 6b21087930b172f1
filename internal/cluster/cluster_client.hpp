#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/cluster/kubectl_commands.hpp"
#include "internal/exec/execution_gateway.hpp"
#include "internal/model/deployment.hpp"
#include "internal/model/instance.hpp"

namespace kuberoll::cluster {

/*
  Typed queries on top of the ExecutionGateway.

  Every call is asynchronous: the handler runs later on the event loop. When
  no error handler is passed, exhausted retries go to the gateway's fatal
  handler.
*/
class ClusterClient {
 public:
  using InstancesHandler   = std::function<void(std::vector<model::Instance> instances)>;
  using DeploymentsHandler = std::function<void(std::vector<model::Deployment> deployments)>;
  using ManifestHandler    = std::function<void(const std::string& manifest)>;
  using ErrorHandler       = exec::ExecutionGateway::ErrorHandler;

  ClusterClient(exec::ExecutionGateway& gateway, KubectlCommands commands);

  void ListInstances(InstancesHandler on_done, ErrorHandler on_error = {});
  void ListDeployments(DeploymentsHandler on_done, ErrorHandler on_error = {});
  void GetManifest(const std::string& deployment, ManifestHandler on_done, ErrorHandler on_error = {});

  // Fills Instance::build with one batched query. Instances the answer does not
  // mention, or whose image carries no build, keep an empty build.
  void ResolveBuilds(std::vector<model::Instance> instances, InstancesHandler on_done, ErrorHandler on_error = {});

  exec::ExecutionGateway& Gateway() {
    return gateway_;
  }

  const KubectlCommands& Commands() const {
    return commands_;
  }

 private:
  exec::ExecutionGateway& gateway_;
  KubectlCommands         commands_;
};

} // namespace kuberoll::cluster
