#include "internal/graph/relationship_graph.hpp"

#include <algorithm>
#include <queue>
#include <unordered_set>

#include "internal/util/errors.hpp"

namespace cloudsim::graph {

namespace {

bool SameEdge(const Edge& edge, const ResourceID& from, const ResourceID& to, RelationshipKind kind) {
  return edge.kind == kind && edge.from == from && edge.to == to;
}

util::NotFound NodeNotFound(const ResourceID& id) {
  return util::NotFound("node " + id.String() + " not found");
}

} // namespace

RelationshipGraph::RelationshipGraph(GraphOptions options) : options_(std::move(options)) {
}

const RelationshipGraph::Adjacency& RelationshipGraph::Require(const ResourceID& id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw NodeNotFound(id);
  return it->second;
}

// ------------------------------------------------------------
// Nodes
// ------------------------------------------------------------

void RelationshipGraph::AddNode(const ResourceID& id, Metadata metadata) {
  if (nodes_.contains(id)) {
    throw util::AlreadyExists("node " + id.String() + " already exists");
  }

  Adjacency adjacency;
  adjacency.node.id       = id;
  adjacency.node.metadata = std::move(metadata);
  nodes_.emplace(id, std::move(adjacency));
}

void RelationshipGraph::RemoveNode(const ResourceID& id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) throw NodeNotFound(id);

  for (const auto& record : it->second.out) {
    if (record.edge.to == id) continue;
    auto& peer_in = nodes_.at(record.edge.to).in;
    std::erase_if(peer_in, [&](const EdgeRecord& r) { return r.edge.from == id; });
  }

  for (const auto& record : it->second.in) {
    if (record.edge.from == id) continue;
    auto& peer_out = nodes_.at(record.edge.from).out;
    std::erase_if(peer_out, [&](const EdgeRecord& r) { return r.edge.to == id; });
  }

  nodes_.erase(it);
}

bool RelationshipGraph::HasNode(const ResourceID& id) const {
  return nodes_.contains(id);
}

Node RelationshipGraph::GetNode(const ResourceID& id) const {
  return Require(id).node;
}

// ------------------------------------------------------------
// Edges
// ------------------------------------------------------------

void RelationshipGraph::AddEdge(const ResourceID& from, const ResourceID& to, RelationshipKind kind) {
  auto from_it = nodes_.find(from);
  if (from_it == nodes_.end()) throw NodeNotFound(from);
  auto to_it = nodes_.find(to);
  if (to_it == nodes_.end()) throw NodeNotFound(to);

  const auto& existing = from_it->second.out;
  if (std::any_of(existing.begin(), existing.end(), [&](const EdgeRecord& r) { return SameEdge(r.edge, from, to, kind); })) {
    return;
  }

  Edge edge{from, to, kind};

  if (options_.schema) {
    const auto& entry = options_.schema->Check(from, to, kind);
    CheckCardinality(entry, edge);
  }

  if (options_.detect_cycles && WouldCreateCycle(from, to)) {
    throw util::WouldCreateCycle(from, to);
  }

  EdgeRecord record{std::move(edge), next_sequence_++};
  from_it->second.out.push_back(record);
  to_it->second.in.push_back(std::move(record));
}

void RelationshipGraph::RemoveEdge(const ResourceID& from, const ResourceID& to, RelationshipKind kind) {
  auto matches = [&](const EdgeRecord& r) { return SameEdge(r.edge, from, to, kind); };

  if (auto it = nodes_.find(from); it != nodes_.end()) {
    std::erase_if(it->second.out, matches);
  }
  if (auto it = nodes_.find(to); it != nodes_.end()) {
    std::erase_if(it->second.in, matches);
  }
}

void RelationshipGraph::CheckCardinality(const SchemaEntry& entry, const Edge& edge) const {
  const auto  key      = RelationshipSchema::Key(edge.from, edge.to);
  const auto& from_adj = nodes_.at(edge.from);
  const auto& to_adj   = nodes_.at(edge.to);

  auto source_taken = [&] {
    return std::any_of(from_adj.out.begin(), from_adj.out.end(), [&](const EdgeRecord& r) {
      return r.edge.kind == edge.kind && r.edge.to.TypeKey() == edge.to.TypeKey();
    });
  };
  auto target_taken = [&] {
    return std::any_of(to_adj.in.begin(), to_adj.in.end(), [&](const EdgeRecord& r) {
      return r.edge.kind == edge.kind && r.edge.from.TypeKey() == edge.from.TypeKey();
    });
  };

  const bool limit_source = entry.cardinality == Cardinality::kOneToOne || entry.cardinality == Cardinality::kManyToOne;
  const bool limit_target = entry.cardinality == Cardinality::kOneToOne || entry.cardinality == Cardinality::kOneToMany;

  if (limit_source && source_taken()) {
    throw util::CardinalityViolation(key, "cardinality violation for " + key + " (" + std::string(ToString(entry.cardinality)) + "): " +
                                              edge.from.String() + " already has a linked " + edge.to.TypeKey());
  }
  if (limit_target && target_taken()) {
    throw util::CardinalityViolation(key, "cardinality violation for " + key + " (" + std::string(ToString(entry.cardinality)) + "): " +
                                              edge.to.String() + " is already linked from another " + edge.from.TypeKey());
  }
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------

std::vector<ResourceID> RelationshipGraph::OutgoingEdges(const ResourceID& id, RelationshipKind kind) const {
  std::vector<ResourceID> result;
  auto                    it = nodes_.find(id);
  if (it == nodes_.end()) return result;

  for (const auto& record : it->second.out) {
    if (record.edge.kind == kind) result.push_back(record.edge.to);
  }
  return result;
}

std::vector<ResourceID> RelationshipGraph::IncomingEdges(const ResourceID& id, RelationshipKind kind) const {
  std::vector<ResourceID> result;
  auto                    it = nodes_.find(id);
  if (it == nodes_.end()) return result;

  for (const auto& record : it->second.in) {
    if (record.edge.kind == kind) result.push_back(record.edge.from);
  }
  return result;
}

std::vector<Edge> RelationshipGraph::IncidentEdges(const ResourceID& id) const {
  std::vector<Edge> result;
  auto              it = nodes_.find(id);
  if (it == nodes_.end()) return result;

  // Both lists are already sorted by sequence; merge them. A self-edge
  // shows up in both lists and is reported once.
  const auto& out = it->second.out;
  const auto& in  = it->second.in;
  std::size_t i = 0, j = 0;
  while (i < out.size() || j < in.size()) {
    if (j == in.size() || (i < out.size() && out[i].sequence < in[j].sequence)) {
      result.push_back(out[i++].edge);
    } else if (i < out.size() && out[i].sequence == in[j].sequence) {
      result.push_back(out[i++].edge);
      ++j;
    } else {
      result.push_back(in[j++].edge);
    }
  }
  return result;
}

std::vector<ResourceID> RelationshipGraph::Reachable(const ResourceID& id, Direction direction) const {
  Require(id);

  std::vector<ResourceID>        result;
  std::unordered_set<ResourceID> visited{id};
  std::queue<ResourceID>         q;
  q.push(id);

  while (!q.empty()) {
    auto current = q.front();
    q.pop();

    const auto& adjacency = nodes_.at(current);
    const auto& edges     = direction == Direction::kOutgoing ? adjacency.out : adjacency.in;
    for (const auto& record : edges) {
      const auto& next = direction == Direction::kOutgoing ? record.edge.to : record.edge.from;
      if (!visited.insert(next).second) continue;
      result.push_back(next);
      q.push(next);
    }
  }

  return result;
}

bool RelationshipGraph::WouldCreateCycle(const ResourceID& from, const ResourceID& to) const {
  // The new edge closes a cycle iff `from` is reachable from `to`.
  std::unordered_set<ResourceID> visited;
  std::vector<ResourceID>        stack{to};

  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();

    if (current == from) return true;
    if (!visited.insert(current).second) continue;

    auto it = nodes_.find(current);
    if (it == nodes_.end()) continue;
    for (const auto& record : it->second.out) {
      if (!visited.contains(record.edge.to)) stack.push_back(record.edge.to);
    }
  }
  return false;
}

std::size_t RelationshipGraph::EdgeCount() const {
  std::size_t count = 0;
  for (const auto& [_, adjacency] : nodes_) count += adjacency.out.size();
  return count;
}

std::vector<Node> RelationshipGraph::Nodes() const {
  std::vector<Node> result;
  result.reserve(nodes_.size());
  for (const auto& [_, adjacency] : nodes_) result.push_back(adjacency.node);

  std::sort(result.begin(), result.end(), [](const Node& a, const Node& b) { return a.id.String() < b.id.String(); });
  return result;
}

std::vector<Edge> RelationshipGraph::Edges() const {
  std::vector<EdgeRecord> records;
  for (const auto& [_, adjacency] : nodes_) {
    records.insert(records.end(), adjacency.out.begin(), adjacency.out.end());
  }
  std::sort(records.begin(), records.end(), [](const EdgeRecord& a, const EdgeRecord& b) { return a.sequence < b.sequence; });

  std::vector<Edge> result;
  result.reserve(records.size());
  for (auto& record : records) result.push_back(std::move(record.edge));
  return result;
}

} // namespace cloudsim::graph
