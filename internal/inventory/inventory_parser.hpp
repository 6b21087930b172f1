#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/model/deployment.hpp"
#include "internal/model/instance.hpp"

namespace kuberoll::inventory {

/*
  Parsers for the default tabular `kubectl get` output.

  Lines that do not have the expected shape (headers, blank lines, warnings)
  are skipped. Parsing never throws; an empty vector is a valid answer.
*/

// NAME READY STATUS RESTARTS ...   e.g. "api-5d4f8-x2k9q   1/1   Running   3 (2m ago)   1h"
std::vector<model::Instance> ParseInstances(std::string_view text);

// NAME READY UP-TO-DATE AVAILABLE AGE         (READY is ready/desired)
// NAME DESIRED CURRENT UP-TO-DATE AVAILABLE   (older kubectl)
std::vector<model::Deployment> ParseDeployments(std::string_view text);

// Strips the replica-set hash and pod suffix: "myapp-7f8c9d-abc12" -> "myapp".
// Ids without both trailing segments are returned unchanged.
std::string DeriveDeploymentName(const std::string& id);

} // namespace kuberoll::inventory
