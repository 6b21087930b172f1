#pragma once

#include <cstdint>
#include <string>

namespace kuberoll::model {

struct Deployment {
  std::string   name;
  std::uint32_t desired_replicas{0};
};

} // namespace kuberoll::model
