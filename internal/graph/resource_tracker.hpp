#pragma once

#include <optional>

#include "internal/graph/dependency_evaluator.hpp"
#include "internal/graph/resource_id.hpp"
#include "internal/graph/types.hpp"

namespace cloudsim::graph {

/*
  What service handlers see of the dependency graph.

  ResourceManager is the real implementation. NullResourceTracker stands in
  when a service is built without dependency tracking.
*/
class ResourceTracker {
 public:
  virtual ~ResourceTracker() = default;

  virtual void RegisterResource(const ResourceID& id, Metadata metadata) = 0;

  // Throws DependencyViolation while the resource still has blockers.
  virtual void UnregisterResource(const ResourceID& id) = 0;

  virtual void AddRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind)    = 0;
  virtual void RemoveRelationship(const ResourceID& from, const ResourceID& to, RelationshipKind kind) = 0;

  virtual DeletionCheck       CanDelete(const ResourceID& id) const    = 0;
  virtual bool                HasResource(const ResourceID& id) const  = 0;
  virtual std::optional<Node> FindResource(const ResourceID& id) const = 0;

  // Strict: a failed relationship update must abort and roll back the caller's
  // operation. Permissive: the caller logs it and carries on.
  virtual bool IsStrictMode() const = 0;
};

/*
  Tracker for services running without cross-resource constraints.
  Every call succeeds and everything is deletable.
*/
class NullResourceTracker final : public ResourceTracker {
 public:
  void RegisterResource(const ResourceID&, Metadata) override {
  }
  void UnregisterResource(const ResourceID&) override {
  }
  void AddRelationship(const ResourceID&, const ResourceID&, RelationshipKind) override {
  }
  void RemoveRelationship(const ResourceID&, const ResourceID&, RelationshipKind) override {
  }

  DeletionCheck CanDelete(const ResourceID&) const override {
    return {};
  }
  bool HasResource(const ResourceID&) const override {
    return false;
  }
  std::optional<Node> FindResource(const ResourceID&) const override {
    return std::nullopt;
  }
  bool IsStrictMode() const override {
    return false;
  }
};

} // namespace cloudsim::graph
