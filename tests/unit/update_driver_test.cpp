#include "internal/rollout/update_driver.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "tests/unit/testing/rollout_harness.hpp"

namespace {

using kuberoll::model::OutcomeStatus;
using kuberoll::testing::FakeCluster;
using kuberoll::testing::RolloutHarness;

void TestAppliedManifestCarriesRequestedBuild() {
  RolloutHarness harness;
  harness.fake.AddDeployment("myapp", 1, "41");
  harness.fake.AddPodSnapshot({{"myapp-9f8e7d-ccccc", "Running", true, "42"}});

  const auto target = RolloutHarness::Target("myapp", 1, "42");
  harness.state.Activate(target);
  harness.driver.UpdateDeployment(target, "41");
  harness.loop.Run();

  const auto& applied = harness.fake.AppliedManifests();
  assert(applied.size() == 1);
  assert(applied[0].find("image: " + FakeCluster::ImageFor("myapp", "42") + "\n") != std::string::npos);
  assert(applied[0].find("image: " + FakeCluster::ImageFor("myapp", "41")) == std::string::npos);
  // kubectl replace leaves the last-applied-configuration annotation alone.
  assert(applied[0].find("\"image\":\"" + FakeCluster::ImageFor("myapp", "41") + "\"") != std::string::npos);

  assert(harness.OutcomeOf("myapp")->status == OutcomeStatus::kConverged);
  assert(harness.fake.Runner()->CountExact("kubectl get pods") == 1);
}

void TestFailedReplaceRetriesFromFetch() {
  RolloutHarness harness;
  harness.fake.AddDeployment("myapp", 1, "41");
  harness.fake.AddPodSnapshot({{"myapp-9f8e7d-ccccc", "Running", true, "42"}});
  harness.fake.Runner()->FailThenReply("kubectl replace -f -", 1, "deployment.apps/myapp replaced\n");

  const auto target = RolloutHarness::Target("myapp", 1, "42");
  harness.state.Activate(target);
  harness.driver.UpdateDeployment(target, "41");
  harness.loop.Run();

  assert(harness.fake.Runner()->CountExact("kubectl get deployment myapp -o yaml") == 2);
  assert(harness.fake.Runner()->CountExact("kubectl replace -f -") == 2);
  for (const auto& call : harness.fake.Runner()->Calls()) {
    if (call.ToString() == "kubectl replace -f -") {
      assert(call.stdin_data.find(":build-42\n") != std::string::npos);
    }
  }
  assert(harness.OutcomeOf("myapp")->status == OutcomeStatus::kConverged);
}

void TestManifestWithoutImageTagFailsMutation() {
  RolloutHarness harness;
  harness.fake.AddDeployment("myapp", 1, "41");
  harness.fake.Runner()->Reply("kubectl get deployment myapp -o yaml", "kind: Deployment\nspec:\n  replicas: 1\n");

  const auto target = RolloutHarness::Target("myapp", 1, "42");
  harness.state.Activate(target);
  harness.driver.UpdateDeployment(target, "41");
  harness.loop.Run();

  const auto* outcome = harness.OutcomeOf("myapp");
  assert(outcome != nullptr);
  assert(outcome->status == OutcomeStatus::kMutationFailed);
  assert(outcome->message.find("no tagged image reference in manifest of myapp") != std::string::npos);

  assert(harness.fake.Runner()->CountExact("kubectl get deployment myapp -o yaml") == 3);
  assert(harness.fake.Runner()->Count("kubectl replace") == 0);
  assert(harness.fake.Runner()->Count("kubectl get pods") == 0);
  assert(harness.state.HasErrors());
  assert(harness.fatal_calls == 0);
}

} // namespace

int main() {
  TestAppliedManifestCarriesRequestedBuild();
  TestFailedReplaceRetriesFromFetch();
  TestManifestWithoutImageTagFailsMutation();

  std::cout << "kuberoll_unit_update_driver: pass\n";
  return 0;
}
