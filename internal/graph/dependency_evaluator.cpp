#include "internal/graph/dependency_evaluator.hpp"

#include <queue>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace cloudsim::graph {

namespace {

struct BlockingPair {
  const ResourceID& blocked;
  const ResourceID& blocker;
};

BlockingPair Orient(const Edge& edge) {
  switch (DependencyEvaluator::BlockedEndpoint(edge.kind)) {
    case DependencyEvaluator::Endpoint::kSource:
      return {edge.from, edge.to};
    case DependencyEvaluator::Endpoint::kTarget:
      return {edge.to, edge.from};
  }
  throw std::logic_error("unhandled blocked endpoint");
}

// With `want_blockers`, the resources blocking `id`; otherwise the resources
// `id` blocks. First occurrence wins, in edge insertion order.
std::vector<ResourceID> Neighbors(const RelationshipGraph& graph, const ResourceID& id, bool want_blockers) {
  std::vector<ResourceID>        result;
  std::unordered_set<ResourceID> seen;

  for (const auto& edge : graph.IncidentEdges(id)) {
    const auto        pair = Orient(edge);
    const ResourceID& self = want_blockers ? pair.blocked : pair.blocker;
    const ResourceID& peer = want_blockers ? pair.blocker : pair.blocked;

    if (self == id && seen.insert(peer).second) {
      result.push_back(peer);
    }
  }
  return result;
}

std::vector<ResourceID> DirectBlockers(const RelationshipGraph& graph, const ResourceID& id) {
  return Neighbors(graph, id, true);
}

std::vector<ResourceID> DirectBlocked(const RelationshipGraph& graph, const ResourceID& id) {
  return Neighbors(graph, id, false);
}

template <typename Step>
std::vector<ResourceID> Closure(const RelationshipGraph& graph, const ResourceID& id, Step step) {
  if (!graph.HasNode(id)) {
    throw util::NotFound("node " + id.String() + " not found");
  }

  std::vector<ResourceID>        result;
  std::unordered_set<ResourceID> visited{id};
  std::queue<ResourceID>         q;
  q.push(id);

  while (!q.empty()) {
    auto current = q.front();
    q.pop();

    for (auto& next : step(graph, current)) {
      if (!visited.insert(next).second) continue;
      result.push_back(next);
      q.push(std::move(next));
    }
  }
  return result;
}

} // namespace

DependencyEvaluator::Endpoint DependencyEvaluator::BlockedEndpoint(RelationshipKind kind) {
  switch (kind) {
    case RelationshipKind::kContains:
      return Endpoint::kSource;
    case RelationshipKind::kAssociatedWith:
    case RelationshipKind::kReferences:
    case RelationshipKind::kAttachedTo:
      return Endpoint::kTarget;
  }
  throw std::logic_error("unhandled relationship kind");
}

DeletionCheck DependencyEvaluator::Evaluate(const RelationshipGraph& graph, const ResourceID& id) {
  if (!graph.HasNode(id)) {
    throw util::NotFound("node " + id.String() + " not found");
  }

  DeletionCheck check;
  check.blockers  = DirectBlockers(graph, id);
  check.deletable = check.blockers.empty();
  return check;
}

std::vector<ResourceID> DependencyEvaluator::Blocked(const RelationshipGraph& graph, const ResourceID& id) {
  if (!graph.HasNode(id)) {
    throw util::NotFound("node " + id.String() + " not found");
  }
  return DirectBlocked(graph, id);
}

std::vector<ResourceID> DependencyEvaluator::TransitiveBlockers(const RelationshipGraph& graph, const ResourceID& id) {
  return Closure(graph, id, DirectBlockers);
}

std::vector<ResourceID> DependencyEvaluator::TransitiveBlocked(const RelationshipGraph& graph, const ResourceID& id) {
  return Closure(graph, id, DirectBlocked);
}

} // namespace cloudsim::graph
