#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace kuberoll::config {

namespace {

constexpr char          kDefaultKubectl[]      = "kubectl";
constexpr std::uint32_t kDefaultMaxAttempts    = 30;
constexpr std::uint32_t kDefaultRetryDelayMs   = 2000;
constexpr std::uint32_t kDefaultPollIntervalMs = 5000;
constexpr std::uint32_t kDefaultTimeoutSeconds = 600;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings: namespace: "2024" is a name, not a number.
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

kuberoll::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  kuberoll::runtime::config::RuntimeConfig config;

  // An empty file is a valid config made only of defaults.
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
    }

    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(&config);
  return config;
}

kuberoll::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  kuberoll::runtime::config::RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(kuberoll::runtime::config::RuntimeConfig* config) {
  auto* cluster = config->mutable_cluster();
  if (cluster->kubectl_path().empty()) cluster->set_kubectl_path(kDefaultKubectl);

  auto* retry = config->mutable_retry();
  if (retry->max_attempts() == 0) retry->set_max_attempts(kDefaultMaxAttempts);
  if (retry->delay_ms() == 0) retry->set_delay_ms(kDefaultRetryDelayMs);

  auto* poll = config->mutable_poll();
  if (poll->interval_ms() == 0) poll->set_interval_ms(kDefaultPollIntervalMs);
  if (poll->timeout_seconds() == 0) poll->set_timeout_seconds(kDefaultTimeoutSeconds);
}

} // namespace kuberoll::config
