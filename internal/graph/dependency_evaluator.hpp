#pragma once

#include <vector>

#include "internal/graph/relationship_graph.hpp"
#include "internal/graph/resource_id.hpp"
#include "internal/graph/types.hpp"

namespace cloudsim::graph {

struct DeletionCheck {
  bool                    deletable = true;
  std::vector<ResourceID> blockers;
};

/*
  Deletion rules.

  The relationship kinds block deletion in opposite edge directions:

    contains          container -> child    the container is blocked
    associated_with   source -> target      the target is blocked
    references        source -> target      the target is blocked
    attached_to       source -> target      the target is blocked

  So a VPC cannot go while it holds a subnet, and a role cannot go while a
  policy is attached to it, but the attached policy itself stays deletable.

  Provider default resources are refused by the handlers before this runs.
*/
class DependencyEvaluator {
 public:
  enum class Endpoint {
    kSource,
    kTarget,
  };

  // The endpoint whose deletion an edge of this kind prevents.
  static Endpoint BlockedEndpoint(RelationshipKind kind);

  // Direct blockers in edge insertion order, without duplicates.
  // Throws NotFound for unknown ids.
  static DeletionCheck Evaluate(const RelationshipGraph& graph, const ResourceID& id);

  // Resources whose deletion `id` currently blocks.
  static std::vector<ResourceID> Blocked(const RelationshipGraph& graph, const ResourceID& id);

  // Everything that has to go, transitively, before `id` becomes deletable.
  static std::vector<ResourceID> TransitiveBlockers(const RelationshipGraph& graph, const ResourceID& id);

  static std::vector<ResourceID> TransitiveBlocked(const RelationshipGraph& graph, const ResourceID& id);
};

} // namespace cloudsim::graph
