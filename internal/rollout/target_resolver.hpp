#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/deployment.hpp"

namespace kuberoll::rollout {

/*
  One positional CLI argument: `name[=build]`. Without a build the target is
  only reported, never updated.
*/
struct TargetRequest {
  std::string                input;
  std::optional<std::string> build;
};

TargetRequest ParseTargetRequest(const std::string& argument);

// Case-insensitive prefix match against the deployment list. An exact name
// wins over longer names sharing the prefix.
// Throws util::NotFound when nothing matches and util::AmbiguousMatch when
// several deployments do.
model::Deployment ResolveDeployment(const std::string& input, const std::vector<model::Deployment>& deployments);

} // namespace kuberoll::rollout
