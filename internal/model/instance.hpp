#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "lifecycle_state.hpp"

namespace kuberoll::model {

/*
  One row of `kubectl get pods`, re-created on every poll tick.

  `name` is the owning deployment's name as derived from `id`; `build`
  stays empty until the batched image query has answered for this id.
*/
struct Instance {
  std::string                id;
  std::string                name;
  bool                       ready{false};
  LifecycleState             state{LifecycleState::kUnknown};
  std::string                status;
  std::uint32_t              restarts{0};
  std::optional<std::string> build;
};

} // namespace kuberoll::model
