#pragma once

#include <map>
#include <string>
#include <string_view>

#include "internal/graph/resource_id.hpp"

namespace cloudsim::graph {

using Metadata = std::map<std::string, std::string>;

/*
  Semantic meaning of an edge. Each kind blocks deletion of exactly one
  endpoint; see DependencyEvaluator::BlockedEndpoint.
*/
enum class RelationshipKind {
  // Parent owns the child (vpc -> subnet). Blocks the container.
  kContains,

  // Attachment without ownership (policy -> role). Blocks the target.
  kAssociatedWith,

  // A resource uses another (instance -> security-group). Blocks the target.
  kReferences,

  // Attachable resource bound to a target (internet-gateway -> vpc). Blocks the target.
  kAttachedTo,
};

enum class Cardinality {
  kOneToOne,
  kOneToMany,
  kManyToOne,
  kManyToMany,
};

std::string_view ToString(RelationshipKind kind);
std::string_view ToString(Cardinality cardinality);

struct Node {
  ResourceID id;
  Metadata   metadata;

  bool IsDefault() const;
};

struct Edge {
  ResourceID       from;
  ResourceID       to;
  RelationshipKind kind = RelationshipKind::kContains;

  // "from -[kind]-> to"
  std::string String() const;

  bool operator==(const Edge&) const = default;
};

} // namespace cloudsim::graph
