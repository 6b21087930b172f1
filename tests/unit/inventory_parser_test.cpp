#include "internal/inventory/inventory_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using kuberoll::inventory::DeriveDeploymentName;
using kuberoll::inventory::ParseDeployments;
using kuberoll::inventory::ParseInstances;
using kuberoll::model::LifecycleState;

void TestInstancesFromDefaultTable() {
  const std::string text =
      "NAME                      READY   STATUS              RESTARTS      AGE\n"
      "myapp-7f8c9d-abc12        1/1     Running             0             5m\n"
      "myapp-7f8c9d-def34        0/1     ContainerCreating   0             3s\n"
      "worker-5d4f8b7c9-x2k9q    0/1     CrashLoopBackOff    7 (30s ago)   12m\n";

  const auto instances = ParseInstances(text);
  assert(instances.size() == 3);

  assert(instances[0].id == "myapp-7f8c9d-abc12");
  assert(instances[0].name == "myapp");
  assert(instances[0].ready);
  assert(instances[0].state == LifecycleState::kRunning);
  assert(instances[0].restarts == 0);
  assert(!instances[0].build);

  assert(!instances[1].ready);
  assert(instances[1].state == LifecycleState::kContainerCreating);

  assert(instances[2].name == "worker");
  assert(instances[2].state == LifecycleState::kCrashLoopBackOff);
  assert(instances[2].restarts == 7);
}

void TestWindowsLineEndingsAndGarbageAreSkipped() {
  const std::string text =
      "NAME   READY   STATUS   RESTARTS   AGE\r\n"
      "\r\n"
      "Warning: something deprecated\r\n"
      "api-1a2b3c-zz9yy   2/2   Terminating   1   1h\r\n";

  const auto instances = ParseInstances(text);
  assert(instances.size() == 1);
  assert(instances[0].id == "api-1a2b3c-zz9yy");
  assert(instances[0].ready);
  assert(instances[0].state == LifecycleState::kTerminating);
  assert(instances[0].status == "Terminating");
}

void TestUnknownStatusIsKeptVerbatim() {
  const auto instances = ParseInstances("api-1a2b3c-zz9yy   0/1   ImagePullBackOff   0   1m\n");
  assert(instances.size() == 1);
  assert(instances[0].state == LifecycleState::kUnknown);
  assert(instances[0].status == "ImagePullBackOff");
}

void TestDeploymentsCurrentFormat() {
  const std::string text =
      "NAME     READY   UP-TO-DATE   AVAILABLE   AGE\n"
      "myapp    2/3     3            2           40d\n"
      "worker   0/0     0            0           2d\n";

  const auto deployments = ParseDeployments(text);
  assert(deployments.size() == 2);
  assert(deployments[0].name == "myapp");
  assert(deployments[0].desired_replicas == 3);
  assert(deployments[1].name == "worker");
  assert(deployments[1].desired_replicas == 0);
}

void TestDeploymentsLegacyFormat() {
  const std::string text =
      "NAME     DESIRED   CURRENT   UP-TO-DATE   AVAILABLE   AGE\n"
      "myapp    4         4         4            4           40d\n";

  const auto deployments = ParseDeployments(text);
  assert(deployments.size() == 1);
  assert(deployments[0].name == "myapp");
  assert(deployments[0].desired_replicas == 4);
}

void TestEmptyOutputYieldsNothing() {
  assert(ParseInstances("").empty());
  assert(ParseDeployments("No resources found in default namespace.\n").empty());
}

void TestDeriveDeploymentName() {
  assert(DeriveDeploymentName("myapp-7f8c9d-abc12") == "myapp");
  assert(DeriveDeploymentName("my-app-backend-7f8c9d-abc12") == "my-app-backend");
  assert(DeriveDeploymentName("standalone") == "standalone");
  assert(DeriveDeploymentName("one-segment") == "one-segment");
}

} // namespace

int main() {
  TestInstancesFromDefaultTable();
  TestWindowsLineEndingsAndGarbageAreSkipped();
  TestUnknownStatusIsKeptVerbatim();
  TestDeploymentsCurrentFormat();
  TestDeploymentsLegacyFormat();
  TestEmptyOutputYieldsNothing();
  TestDeriveDeploymentName();

  std::cout << "kuberoll_unit_inventory_parser: pass\n";
  return 0;
}
