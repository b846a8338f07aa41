#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace taskvault::config {

using taskvault::runtime::config::FAILED_TRANSITION_POLICY_ENFORCE;
using taskvault::runtime::config::FAILED_TRANSITION_POLICY_UNSPECIFIED;
using taskvault::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultVaultRoot   = ".";
constexpr int64_t     kDefaultApprovalTtl = 12 * 60 * 60;
constexpr uint32_t    kDefaultMaxRetries  = 3;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
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

static void ApplyDefaults(RuntimeConfig* config) {
  if (config->vault().root().empty()) {
    config->mutable_vault()->set_root(kDefaultVaultRoot);
  }
  if (!config->approval().has_default_ttl()) {
    *config->mutable_approval()->mutable_default_ttl() = google::protobuf::util::TimeUtil::SecondsToDuration(kDefaultApprovalTtl);
  }
  if (!config->retry().has_max_retries()) {
    config->mutable_retry()->set_max_retries(kDefaultMaxRetries);
  }
  if (config->retry().failed_policy() == FAILED_TRANSITION_POLICY_UNSPECIFIED) {
    config->mutable_retry()->set_failed_policy(FAILED_TRANSITION_POLICY_ENFORCE);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document is a valid "all defaults" config
  if (!yaml.IsNull()) {
    if (!yaml.IsMap()) {
      throw std::runtime_error("Invalid configuration: top level must be a mapping");
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

} // namespace taskvault::config
