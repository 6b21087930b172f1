#include "arguments.hpp"

#include <string_view>

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace kuberoll::config {

namespace {

// "--flag=value" -> value when the argument carries this flag.
std::optional<std::string> FlagValue(std::string_view argument, std::string_view flag) {
  if (!util::StartsWith(argument, flag)) return std::nullopt;

  argument.remove_prefix(flag.size());
  if (argument.empty() || argument.front() != '=') return std::nullopt;

  argument.remove_prefix(1);
  if (argument.empty()) {
    throw util::InvalidArgument("missing value for " + std::string(flag));
  }
  return std::string(argument);
}

std::uint32_t ParseSeconds(const std::string& value) {
  if (value.find_first_not_of("0123456789") != std::string::npos) {
    throw util::InvalidArgument("--timeout expects a whole number of seconds, got '" + value + "'");
  }
  const auto seconds = util::ParseUint32(value);
  if (seconds == 0) {
    throw util::InvalidArgument("--timeout must be greater than zero");
  }
  return seconds;
}

} // namespace

Invocation ParseArguments(int argc, const char* const* argv) {
  Invocation invocation;

  for (int i = 1; i < argc; ++i) {
    const std::string_view argument = argv[i];

    if (argument == "--help" || argument == "-h") {
      invocation.help = true;
    } else if (auto value = FlagValue(argument, "--config")) {
      invocation.config_path = *value;
    } else if (auto value = FlagValue(argument, "--namespace")) {
      invocation.namespace_name = *value;
    } else if (auto value = FlagValue(argument, "--kubeconfig")) {
      invocation.kubeconfig = *value;
    } else if (auto value = FlagValue(argument, "--log-level")) {
      invocation.log_level = *value;
    } else if (auto value = FlagValue(argument, "--timeout")) {
      invocation.timeout_seconds = ParseSeconds(*value);
    } else if (util::StartsWith(argument, "-")) {
      throw util::InvalidArgument("unknown option " + std::string(argument));
    } else {
      invocation.targets.emplace_back(argument);
    }
  }

  if (!invocation.help && invocation.targets.empty()) {
    throw util::InvalidArgument("No deployment names provided");
  }
  return invocation;
}

void ApplyOverrides(const Invocation& invocation, kuberoll::runtime::config::RuntimeConfig* config) {
  if (invocation.namespace_name) config->mutable_cluster()->set_namespace_name(*invocation.namespace_name);
  if (invocation.kubeconfig) config->mutable_cluster()->set_kubeconfig(*invocation.kubeconfig);
  if (invocation.log_level) config->mutable_logging()->set_level(*invocation.log_level);
  if (invocation.timeout_seconds) config->mutable_poll()->set_timeout_seconds(*invocation.timeout_seconds);
}

std::string Usage() {
  return "Usage:\n"
         "  kuberoll [options] <deployment>[=<build>]...\n"
         "\n"
         "  <deployment>          deployment name or unique prefix\n"
         "  =<build>              roll the deployment to image tag build-<build>;\n"
         "                        without it the current build is only reported\n"
         "\n"
         "Options:\n"
         "  --namespace=<ns>      namespace passed to kubectl\n"
         "  --kubeconfig=<path>   kubeconfig passed to kubectl\n"
         "  --timeout=<seconds>   give up waiting for instances after this long (default 600)\n"
         "  --config=<file>       YAML runtime configuration\n"
         "  --log-level=<level>   trace, debug, info, warn, error\n"
         "  --help                show this message\n";
}

} // namespace kuberoll::config
