#include "internal/inventory/build_extractor.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using kuberoll::inventory::ExtractBuild;
using kuberoll::inventory::ExtractManifestBuild;
using kuberoll::inventory::ParseInstanceBuilds;
using kuberoll::inventory::RewriteBuild;

const char* kManifest = R"(apiVersion: apps/v1
kind: Deployment
metadata:
  name: myapp
  namespace: default
spec:
  replicas: 3
  template:
    spec:
      containers:
      - name: myapp
        image: registry.example.com:5000/team/myapp:build-41
        ports:
        - containerPort: 8080
      - name: sidecar
        image: registry.example.com:5000/team/proxy:build-7
)";

// `kubectl get deployment -o yaml` output for a deployment whose image was
// last changed by `kubectl set image`: the annotation still holds build-40.
const char* kAppliedManifest = R"(apiVersion: apps/v1
kind: Deployment
metadata:
  annotations:
    deployment.kubernetes.io/revision: "7"
    kubectl.kubernetes.io/last-applied-configuration: |
      {"apiVersion":"apps/v1","kind":"Deployment","metadata":{"annotations":{},"name":"api","namespace":"default"},"spec":{"replicas":2,"template":{"spec":{"containers":[{"image":"registry/api:build-40","name":"api"}]}}}}
  creationTimestamp: "2024-03-02T10:15:00Z"
  generation: 7
  name: api
  namespace: default
spec:
  replicas: 2
  template:
    spec:
      containers:
      - image: registry/api:build-41
        imagePullPolicy: IfNotPresent
        name: api
status:
  readyReplicas: 2
)";

void TestExtractBuildFromManifest() {
  const auto build = ExtractManifestBuild(kManifest);
  assert(build);
  assert(*build == "41");
}

void TestManifestBuildIgnoresLastAppliedAnnotation() {
  const auto build = ExtractManifestBuild(kAppliedManifest);
  assert(build);
  assert(*build == "41");

  // The annotation only carries JSON "image" keys, never an `image:` field.
  assert(!ExtractManifestBuild(R"({"containers":[{"image":"registry/api:build-40"}]})"));
}

void TestRewriteLeavesLastAppliedAnnotation() {
  const auto rewritten = RewriteBuild(kAppliedManifest, "42");
  assert(rewritten);
  assert(rewritten->find("- image: registry/api:build-42\n") != std::string::npos);
  assert(rewritten->find(R"("image":"registry/api:build-40")") != std::string::npos);
  assert(ExtractManifestBuild(*rewritten) == std::string("42"));
}

void TestExtractBuildIgnoresUntaggedImages() {
  assert(!ExtractBuild("image: registry/app:latest\n"));
  assert(!ExtractBuild("image: registry:5000/app\n"));
  assert(!ExtractBuild(""));
  assert(!ExtractManifestBuild("image: registry:5000/app\n"));

  const auto quoted = ExtractBuild(R"(image: "registry/app:build-9")");
  assert(quoted && *quoted == "9");
}

void TestParseInstanceBuildsKeyedById() {
  const std::string text =
      "myapp-7f8c9d-def34   registry/myapp:build-42,registry/proxy:build-7\n"
      "myapp-7f8c9d-abc12   registry/myapp:build-41\n"
      "myapp-7f8c9d-zzz99   registry/myapp:latest\n";

  const auto builds = ParseInstanceBuilds(text);
  assert(builds.size() == 3);
  assert(builds.at("myapp-7f8c9d-abc12") == std::string("41"));
  assert(builds.at("myapp-7f8c9d-def34") == std::string("42"));
  assert(!builds.at("myapp-7f8c9d-zzz99"));
}

void TestParseInstanceBuildsSkipsHeader() {
  const auto builds = ParseInstanceBuilds("NAME   IMAGE\nmyapp-7f8c9d-abc12   registry/myapp:build-5\r\n");
  assert(builds.size() == 1);
  assert(builds.count("NAME") == 0);
  assert(builds.at("myapp-7f8c9d-abc12") == std::string("5"));
}

void TestRewriteReplacesFirstImageOnly() {
  const auto rewritten = RewriteBuild(kManifest, "42");
  assert(rewritten);
  assert(rewritten->find("image: registry.example.com:5000/team/myapp:build-42\n") != std::string::npos);
  assert(rewritten->find("image: registry.example.com:5000/team/proxy:build-7\n") != std::string::npos);
  assert(rewritten->find("build-41") == std::string::npos);
  assert(ExtractManifestBuild(*rewritten) == std::string("42"));
}

void TestRewriteIsIdempotent() {
  const auto once  = RewriteBuild(kManifest, "42");
  const auto twice = RewriteBuild(*once, "42");
  assert(twice);
  assert(*once == *twice);
}

void TestRewriteKeepsQuotes() {
  const auto rewritten = RewriteBuild("      image: \"registry/app:build-1\"\n", "2");
  assert(rewritten);
  assert(*rewritten == "      image: \"registry/app:build-2\"\n");
}

void TestRewriteWithoutTaggedImageFails() {
  assert(!RewriteBuild("kind: Deployment\nspec: {}\n", "42"));
  assert(!RewriteBuild("image: registry/app\n", "42"));
}

} // namespace

int main() {
  TestExtractBuildFromManifest();
  TestManifestBuildIgnoresLastAppliedAnnotation();
  TestRewriteLeavesLastAppliedAnnotation();
  TestExtractBuildIgnoresUntaggedImages();
  TestParseInstanceBuildsKeyedById();
  TestParseInstanceBuildsSkipsHeader();
  TestRewriteReplacesFirstImageOnly();
  TestRewriteIsIdempotent();
  TestRewriteKeepsQuotes();
  TestRewriteWithoutTaggedImageFails();

  std::cout << "kuberoll_unit_build_extractor: pass\n";
  return 0;
}
