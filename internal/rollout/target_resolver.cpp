#include "target_resolver.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace kuberoll::rollout {

TargetRequest ParseTargetRequest(const std::string& argument) {
  TargetRequest request;

  const auto separator = argument.find('=');
  if (separator == std::string::npos) {
    request.input = argument;
  } else {
    request.input = argument.substr(0, separator);
    request.build = argument.substr(separator + 1);
  }

  if (request.input.empty()) {
    throw util::InvalidArgument("empty deployment name in '" + argument + "'");
  }
  if (request.build && request.build->empty()) {
    throw util::InvalidArgument("empty build in '" + argument + "'");
  }
  return request;
}

model::Deployment ResolveDeployment(const std::string& input, const std::vector<model::Deployment>& deployments) {
  const auto prefix = util::ToLower(input);

  std::vector<const model::Deployment*> matches;
  for (const auto& deployment : deployments) {
    const auto name = util::ToLower(deployment.name);
    if (name == prefix) {
      return deployment;
    }
    if (util::StartsWith(name, prefix)) {
      matches.push_back(&deployment);
    }
  }

  if (matches.empty()) {
    throw util::NotFound("Could not find any deployment that starts with " + input);
  }

  if (matches.size() > 1) {
    std::vector<std::string> names;
    for (const auto* match : matches) {
      names.push_back(match->name);
    }
    throw util::AmbiguousMatch("More than one deployment matches '" + input + "': " + util::Join(names, ", "));
  }

  return *matches.front();
}

} // namespace kuberoll::rollout
