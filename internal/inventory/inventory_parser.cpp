#include "inventory_parser.hpp"

#include <regex>

#include "internal/util/strings.hpp"

namespace kuberoll::inventory {

namespace {

const std::regex& InstanceLine() {
  static const std::regex kPattern(R"(^(\S+)\s+(\d+)/(\d+)\s+(\S+)\s+(\d+))");
  return kPattern;
}

const std::regex& CurrentDeploymentLine() {
  static const std::regex kPattern(R"(^(\S+)\s+(\d+)/(\d+)\s+)");
  return kPattern;
}

const std::regex& LegacyDeploymentLine() {
  static const std::regex kPattern(R"(^(\S+)\s+(\d+)\s+(\d+)\s+)");
  return kPattern;
}

const std::regex& GeneratedSuffix() {
  static const std::regex kPattern(R"(^(.+)-[0-9a-z]+-[0-9a-z]+$)");
  return kPattern;
}

} // namespace

std::string DeriveDeploymentName(const std::string& id) {
  std::smatch match;
  if (std::regex_match(id, match, GeneratedSuffix())) {
    return match[1].str();
  }
  return id;
}

std::vector<model::Instance> ParseInstances(std::string_view text) {
  std::vector<model::Instance> instances;

  for (const auto& line : util::SplitLines(text)) {
    std::smatch match;
    if (!std::regex_search(line, match, InstanceLine())) continue;

    model::Instance instance;
    instance.id       = match[1].str();
    instance.name     = DeriveDeploymentName(instance.id);
    instance.ready    = match[2].str() == match[3].str();
    instance.status   = match[4].str();
    instance.state    = model::ParseLifecycleState(instance.status);
    instance.restarts = util::ParseUint32(match[5].str());
    instances.push_back(std::move(instance));
  }

  return instances;
}

std::vector<model::Deployment> ParseDeployments(std::string_view text) {
  std::vector<model::Deployment> deployments;

  for (const auto& line : util::SplitLines(text)) {
    std::smatch match;
    model::Deployment deployment;

    if (std::regex_search(line, match, CurrentDeploymentLine())) {
      deployment.name             = match[1].str();
      deployment.desired_replicas = util::ParseUint32(match[3].str());
    } else if (std::regex_search(line, match, LegacyDeploymentLine())) {
      deployment.name             = match[1].str();
      deployment.desired_replicas = util::ParseUint32(match[2].str());
    } else {
      continue;
    }

    deployments.push_back(std::move(deployment));
  }

  return deployments;
}

} // namespace kuberoll::inventory
