#pragma once

#include "internal/graph/relationship_schema.hpp"

namespace cloudsim::graph {

/*
  Relationships between emulated resources as the provider API models them.

  Containment is written container -> child; every other kind is written
  attaching side -> target. DependencyEvaluator relies on that orientation.
*/
RelationshipSchema BuildProviderSchema();

} // namespace cloudsim::graph
