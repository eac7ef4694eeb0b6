#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/graph/resource_id.hpp"
#include "internal/graph/types.hpp"

namespace cloudsim::graph {

struct SchemaEntry {
  RelationshipKind kind        = RelationshipKind::kContains;
  Cardinality      cardinality = Cardinality::kManyToMany;
  std::string      description;
};

/*
  Table of legal relationships between resource types.

  Keys have the form "service:type -> service:type" and are written from the
  edge's source side. The table is filled once before the owning graph is
  shared between threads and is read-only afterwards.
*/
class RelationshipSchema {
 public:
  void Add(const std::string& from_service, const std::string& from_type, const std::string& to_service, const std::string& to_type,
           SchemaEntry entry);

  const SchemaEntry* Lookup(const ResourceID& from, const ResourceID& to) const;

  // True when the (from type, kind, to type) triple is declared.
  bool Validate(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const;

  // Same as Validate, but throws SchemaViolation describing the failure.
  const SchemaEntry& Check(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const;

  std::vector<std::string> EntriesFrom(const std::string& service, const std::string& type) const;
  std::vector<std::string> EntriesTo(const std::string& service, const std::string& type) const;

  std::size_t Size() const {
    return entries_.size();
  }

  static std::string Key(const ResourceID& from, const ResourceID& to);

 private:
  std::unordered_map<std::string, SchemaEntry> entries_;
};

} // namespace cloudsim::graph
