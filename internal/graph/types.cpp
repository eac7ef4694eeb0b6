#include "internal/graph/types.hpp"

namespace cloudsim::graph {

std::string_view ToString(RelationshipKind kind) {
  switch (kind) {
    case RelationshipKind::kContains:
      return "contains";
    case RelationshipKind::kAssociatedWith:
      return "associated_with";
    case RelationshipKind::kReferences:
      return "references";
    case RelationshipKind::kAttachedTo:
      return "attached_to";
  }
  return "unknown";
}

std::string_view ToString(Cardinality cardinality) {
  switch (cardinality) {
    case Cardinality::kOneToOne:
      return "one-to-one";
    case Cardinality::kOneToMany:
      return "one-to-many";
    case Cardinality::kManyToOne:
      return "many-to-one";
    case Cardinality::kManyToMany:
      return "many-to-many";
  }
  return "unknown";
}

bool Node::IsDefault() const {
  auto it = metadata.find("default");
  return it != metadata.end() && it->second == "true";
}

std::string Edge::String() const {
  return from.String() + " -[" + std::string(ToString(kind)) + "]-> " + to.String();
}

} // namespace cloudsim::graph
