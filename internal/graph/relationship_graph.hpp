#pragma once

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "internal/graph/relationship_schema.hpp"
#include "internal/graph/resource_id.hpp"
#include "internal/graph/types.hpp"

namespace cloudsim::graph {

struct GraphOptions {
  // Reject edges that would close a directed cycle.
  bool detect_cycles = true;

  // Legal relationships. Null means every relationship is accepted.
  std::shared_ptr<const RelationshipSchema> schema;
};

enum class Direction {
  kOutgoing,
  kIncoming,
};

/*
  Directed, typed resource graph.

  Guarantees:
    - every edge endpoint is a registered node
    - at most one edge per (from, to, kind)
    - acyclic when detect_cycles is set
    - every edge is declared by the schema, when one is installed

  Not synchronized. ResourceManager owns the lock.
*/
class RelationshipGraph {
 public:
  explicit RelationshipGraph(GraphOptions options = {});

  void AddNode(const ResourceID& id, Metadata metadata);

  // Removes the node and every edge touching it.
  void RemoveNode(const ResourceID& id);

  bool HasNode(const ResourceID& id) const;
  Node GetNode(const ResourceID& id) const;

  // Re-adding an existing edge is a no-op.
  void AddEdge(const ResourceID& from, const ResourceID& to, RelationshipKind kind);

  // Missing edges are ignored.
  void RemoveEdge(const ResourceID& from, const ResourceID& to, RelationshipKind kind);

  // Targets of `id`'s edges of this kind, in insertion order.
  std::vector<ResourceID> OutgoingEdges(const ResourceID& id, RelationshipKind kind) const;

  // Sources of edges of this kind pointing at `id`, in insertion order.
  std::vector<ResourceID> IncomingEdges(const ResourceID& id, RelationshipKind kind) const;

  // Every edge touching `id`, in global insertion order.
  std::vector<Edge> IncidentEdges(const ResourceID& id) const;

  // Breadth-first closure over edges of any kind, excluding `id` itself.
  std::vector<ResourceID> Reachable(const ResourceID& id, Direction direction) const;

  bool WouldCreateCycle(const ResourceID& from, const ResourceID& to) const;

  std::size_t NodeCount() const {
    return nodes_.size();
  }
  std::size_t EdgeCount() const;

  std::vector<Node> Nodes() const;
  std::vector<Edge> Edges() const;

  const RelationshipSchema* Schema() const {
    return options_.schema.get();
  }
  bool DetectsCycles() const {
    return options_.detect_cycles;
  }

 private:
  struct EdgeRecord {
    Edge          edge;
    std::uint64_t sequence = 0;
  };

  struct Adjacency {
    Node                    node;
    std::vector<EdgeRecord> out;
    std::vector<EdgeRecord> in;
  };

  const Adjacency& Require(const ResourceID& id) const;
  void             CheckCardinality(const SchemaEntry& entry, const Edge& edge) const;

  GraphOptions                              options_;
  std::unordered_map<ResourceID, Adjacency> nodes_;
  std::uint64_t                             next_sequence_ = 0;
};

} // namespace cloudsim::graph
