#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/graph/resource_manager.hpp"

namespace cloudsim::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Graph settings the
  file leaves out keep the values from Defaults().
*/
class ConfigLoader {
 public:
  static cloudsim::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static cloudsim::runtime::config::RuntimeConfig Defaults();
};

graph::ResourceManagerConfig ToResourceManagerConfig(const cloudsim::runtime::config::GraphConfig& graph);

} // namespace cloudsim::config
