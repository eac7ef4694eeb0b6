#include "internal/graph/resource_manager.hpp"

#include <mutex>

#include "internal/graph/default_topology.hpp"
#include "internal/graph/provider_schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cloudsim::graph {

namespace {

std::shared_ptr<const RelationshipSchema> ResolveSchema(const ResourceManagerConfig& config, std::shared_ptr<const RelationshipSchema> schema) {
  if (schema) return schema;
  if (config.use_provider_schema) return std::make_shared<const RelationshipSchema>(BuildProviderSchema());
  return nullptr;
}

} // namespace

ResourceManager::ResourceManager(ResourceManagerConfig config, std::shared_ptr<const RelationshipSchema> schema)
    : config_(config), schema_(ResolveSchema(config, std::move(schema))), graph_(GraphOptions{config.detect_cycles, schema_}) {
  if (config_.seed_network_defaults) {
    SeedDefaultNetworkTopology(*this);
    CLOUDSIM_LOG_DEBUG("Seeded default network topology", {observability::IntField("resources", static_cast<std::int64_t>(graph_.NodeCount()))});
  }
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------

void ResourceManager::RegisterResource(const ResourceID& id, Metadata metadata) {
  std::unique_lock lock(mutex_);
  graph_.AddNode(id, std::move(metadata));
}

void ResourceManager::UnregisterResource(const ResourceID& id) {
  std::unique_lock lock(mutex_);

  auto check = DependencyEvaluator::Evaluate(graph_, id);
  if (!check.deletable) {
    throw util::DependencyViolation(id, std::move(check.blockers));
  }
  graph_.RemoveNode(id);
}

void ResourceManager::AddRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) {
  std::unique_lock lock(mutex_);
  graph_.AddEdge(from, to, kind);
}

void ResourceManager::RemoveRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) {
  std::unique_lock lock(mutex_);
  graph_.RemoveEdge(from, to, kind);
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

DeletionCheck ResourceManager::CanDelete(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return DependencyEvaluator::Evaluate(graph_, id);
}

bool ResourceManager::HasResource(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return graph_.HasNode(id);
}

std::optional<Node> ResourceManager::FindResource(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  if (!graph_.HasNode(id)) return std::nullopt;
  return graph_.GetNode(id);
}

bool ResourceManager::IsStrictMode() const {
  return config_.strict_validation;
}

Node ResourceManager::GetResource(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return graph_.GetNode(id);
}

std::vector<ResourceID> ResourceManager::GetDependents(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return DependencyEvaluator::Evaluate(graph_, id).blockers;
}

std::vector<ResourceID> ResourceManager::GetDependencies(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return DependencyEvaluator::Blocked(graph_, id);
}

std::vector<ResourceID> ResourceManager::GetAllDependents(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return DependencyEvaluator::TransitiveBlockers(graph_, id);
}

std::vector<ResourceID> ResourceManager::GetAllDependencies(const ResourceID& id) const {
  std::shared_lock lock(mutex_);
  return DependencyEvaluator::TransitiveBlocked(graph_, id);
}

std::size_t ResourceManager::ResourceCount() const {
  std::shared_lock lock(mutex_);
  return graph_.NodeCount();
}

std::size_t ResourceManager::RelationshipCount() const {
  std::shared_lock lock(mutex_);
  return graph_.EdgeCount();
}

std::vector<Edge> ResourceManager::Relationships() const {
  std::shared_lock lock(mutex_);
  return graph_.Edges();
}

void ResourceManager::ValidateRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const {
  if (!schema_) return;
  schema_->Check(from, to, kind);
}

} // namespace cloudsim::graph
