#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "cloudsim_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaults() {
  const auto config = cloudsim::config::ConfigLoader::Defaults();
  assert(config.logging().level() == "info");
  assert(config.graph().dependency_tracking());
  assert(!config.graph().strict_validation());
  assert(config.graph().detect_cycles());
  assert(config.graph().use_provider_schema());
  assert(config.graph().seed_network_defaults());
}

void TestPartialFileOnlyOverridesWhatItNames() {
  const auto yaml_path = WriteYaml("partial",
                                   R"(graph:
  strict_validation: true
  detect_cycles: false
)");

  auto config = cloudsim::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.graph().strict_validation());
  assert(!config.graph().detect_cycles());
  assert(config.graph().dependency_tracking());
  assert(config.graph().use_provider_schema());
  assert(config.graph().seed_network_defaults());
  assert(config.logging().level() == "info");
}

void TestLoggingSection() {
  const auto yaml_path = WriteYaml("logging",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
graph:
  dependency_tracking: false
)");

  auto config = cloudsim::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.graph().has_dependency_tracking());
  assert(!config.graph().dependency_tracking());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(graph:
  strict_validation: true
  cascade_deletes: true
)");

  bool threw = false;
  try {
    (void)cloudsim::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)cloudsim::config::ConfigLoader::LoadFromYaml("/nonexistent/cloudsim.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestToResourceManagerConfig() {
  cloudsim::runtime::config::GraphConfig graph;
  graph.set_strict_validation(true);
  graph.set_use_provider_schema(false);

  const auto config = cloudsim::config::ToResourceManagerConfig(graph);
  assert(config.strict_validation);
  assert(!config.use_provider_schema);
  assert(config.detect_cycles);
  assert(!config.seed_network_defaults);

  const auto from_defaults = cloudsim::config::ToResourceManagerConfig(cloudsim::config::ConfigLoader::Defaults().graph());
  assert(from_defaults.seed_network_defaults);
  assert(from_defaults.use_provider_schema);
  assert(!from_defaults.strict_validation);
}

} // namespace

int main() {
  TestDefaults();
  TestPartialFileOnlyOverridesWhatItNames();
  TestLoggingSection();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestToResourceManagerConfig();

  std::cout << "cloudsim_unit_config_loader: pass\n";
  return 0;
}
