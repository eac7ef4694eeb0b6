#include "factory.hpp"

#include <cstdint>
#include <memory>

#include "internal/config/config_loader.hpp"
#include "internal/graph/resource_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/state/memory_state_store.hpp"

namespace cloudsim::factory {

using cloudsim::observability::BoolField;
using cloudsim::observability::IntField;

namespace {

std::shared_ptr<graph::ResourceTracker> BuildTracker(const cloudsim::runtime::config::GraphConfig& graph_config) {
  if (graph_config.has_dependency_tracking() && !graph_config.dependency_tracking()) {
    CLOUDSIM_LOG_INFO("dependency tracking disabled");
    return std::make_shared<graph::NullResourceTracker>();
  }

  const auto manager_config = config::ToResourceManagerConfig(graph_config);
  auto       manager        = std::make_shared<graph::ResourceManager>(manager_config);

  CLOUDSIM_LOG_INFO("dependency tracking enabled",
                    {BoolField("strict_validation", manager_config.strict_validation), BoolField("detect_cycles", manager_config.detect_cycles),
                     BoolField("provider_schema", manager->Schema() != nullptr), IntField("seeded_resources", static_cast<std::int64_t>(manager->ResourceCount()))});
  return manager;
}

} // namespace

/*
    Build full emulator dependency graph
*/
RuntimeDependencies BuildRuntime(const cloudsim::runtime::config::RuntimeConfig& config) {
  observability::InitializeLogging(config);

  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Shared state
  // ------------------------------------------------------------------
  deps.state     = std::make_shared<state::memory::MemoryStateStore>();
  deps.resources = BuildTracker(config.graph());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.state     = deps.state;
  ctx.resources = deps.resources;

  deps.identity_service = std::make_shared<service::IdentityService>(ctx);
  deps.network_service  = std::make_shared<service::NetworkService>(ctx);

  return deps;
}

} // namespace cloudsim::factory
