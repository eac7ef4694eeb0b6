#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace cloudsim::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

cloudsim::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  cloudsim::runtime::config::RuntimeConfig config;

  config.mutable_logging()->set_level("info");

  auto* graph = config.mutable_graph();
  graph->set_dependency_tracking(true);
  graph->set_strict_validation(false);
  graph->set_detect_cycles(true);
  graph->set_use_provider_schema(true);
  graph->set_seed_network_defaults(true);

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

cloudsim::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  cloudsim::runtime::config::RuntimeConfig loaded;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &loaded, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  // Graph fields carry presence, so MergeFrom only overrides what the file set.
  auto config = Defaults();
  config.MergeFrom(loaded);
  return config;
}

graph::ResourceManagerConfig ToResourceManagerConfig(const cloudsim::runtime::config::GraphConfig& graph) {
  // Unset fields keep the ResourceManagerConfig defaults.
  graph::ResourceManagerConfig config;
  if (graph.has_strict_validation()) config.strict_validation = graph.strict_validation();
  if (graph.has_detect_cycles()) config.detect_cycles = graph.detect_cycles();
  if (graph.has_use_provider_schema()) config.use_provider_schema = graph.use_provider_schema();
  if (graph.has_seed_network_defaults()) config.seed_network_defaults = graph.seed_network_defaults();
  return config;
}

} // namespace cloudsim::config
