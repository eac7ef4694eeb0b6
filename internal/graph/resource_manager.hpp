#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "internal/graph/dependency_evaluator.hpp"
#include "internal/graph/relationship_graph.hpp"
#include "internal/graph/relationship_schema.hpp"
#include "internal/graph/resource_tracker.hpp"

namespace cloudsim::graph {

struct ResourceManagerConfig {
  // Relationship failures abort the caller's operation (see IsStrictMode).
  bool strict_validation = false;

  bool detect_cycles = true;

  // Install BuildProviderSchema() when no schema is passed explicitly.
  bool use_provider_schema = true;

  // Register the default VPC and its members at construction.
  bool seed_network_defaults = false;
};

/*
  Thread-safe facade over RelationshipGraph shared by all emulated services.

  Locking model:
  - Mutations (register, unregister, relationship changes) take the lock exclusively.
  - Queries take it shared, so a deletion check never sees a half-applied mutation.
  - The schema is immutable once constructed and is read without locking.
*/
class ResourceManager final : public ResourceTracker {
 public:
  explicit ResourceManager(ResourceManagerConfig config = {}, std::shared_ptr<const RelationshipSchema> schema = nullptr);

  void RegisterResource(const ResourceID& id, Metadata metadata) override;
  void UnregisterResource(const ResourceID& id) override;

  void AddRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) override;
  void RemoveRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) override;

  DeletionCheck       CanDelete(const ResourceID& id) const override;
  bool                HasResource(const ResourceID& id) const override;
  std::optional<Node> FindResource(const ResourceID& id) const override;
  bool                IsStrictMode() const override;

  Node GetResource(const ResourceID& id) const;

  // Direct blockers of `id` (same as CanDelete().blockers).
  std::vector<ResourceID> GetDependents(const ResourceID& id) const;

  // Resources whose deletion `id` itself blocks.
  std::vector<ResourceID> GetDependencies(const ResourceID& id) const;

  std::vector<ResourceID> GetAllDependents(const ResourceID& id) const;
  std::vector<ResourceID> GetAllDependencies(const ResourceID& id) const;

  std::size_t ResourceCount() const;
  std::size_t RelationshipCount() const;

  std::vector<Edge> Relationships() const;

  // Schema check only; does not touch the graph. Throws SchemaViolation.
  void ValidateRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const;

  const RelationshipSchema* Schema() const {
    return schema_.get();
  }

 private:
  const ResourceManagerConfig               config_;
  std::shared_ptr<const RelationshipSchema> schema_;

  mutable std::shared_mutex mutex_;
  RelationshipGraph         graph_;
};

} // namespace cloudsim::graph
