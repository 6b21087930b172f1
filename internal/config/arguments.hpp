#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace kuberoll::config {

/*
  Command line of one kuberoll run.

      kuberoll [--config=<file>] [--namespace=<ns>] [--kubeconfig=<path>]
               [--timeout=<seconds>] [--log-level=<level>] name[=build]...

  Flags given here win over the config file.
*/
struct Invocation {
  bool                         help{false};
  std::string                  config_path;
  std::optional<std::string>   namespace_name;
  std::optional<std::string>   kubeconfig;
  std::optional<std::string>   log_level;
  std::optional<std::uint32_t> timeout_seconds;
  std::vector<std::string>     targets;
};

// Throws util::InvalidArgument on unknown flags, malformed values or when no
// target is given (unless --help).
Invocation ParseArguments(int argc, const char* const* argv);

void ApplyOverrides(const Invocation& invocation, kuberoll::runtime::config::RuntimeConfig* config);

std::string Usage();

} // namespace kuberoll::config
