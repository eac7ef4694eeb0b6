#include "internal/graph/relationship_schema.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace cloudsim::graph {

namespace {

std::string MakeKey(const std::string& from_type_key, const std::string& to_type_key) {
  return from_type_key + " -> " + to_type_key;
}

} // namespace

std::string RelationshipSchema::Key(const ResourceID& from, const ResourceID& to) {
  return MakeKey(from.TypeKey(), to.TypeKey());
}

void RelationshipSchema::Add(const std::string& from_service, const std::string& from_type, const std::string& to_service,
                             const std::string& to_type, SchemaEntry entry) {
  entries_[MakeKey(from_service + ":" + from_type, to_service + ":" + to_type)] = std::move(entry);
}

const SchemaEntry* RelationshipSchema::Lookup(const ResourceID& from, const ResourceID& to) const {
  auto it = entries_.find(Key(from, to));
  if (it == entries_.end()) return nullptr;
  return &it->second;
}

bool RelationshipSchema::Validate(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const {
  const auto* entry = Lookup(from, to);
  return entry != nullptr && entry->kind == kind;
}

const SchemaEntry& RelationshipSchema::Check(const ResourceID& from, const ResourceID& to, RelationshipKind kind) const {
  const auto key   = Key(from, to);
  const auto* entry = Lookup(from, to);
  if (entry == nullptr) {
    throw util::SchemaViolation(key, "relationship not defined in schema: " + key);
  }
  if (entry->kind != kind) {
    throw util::SchemaViolation(key, "relationship kind mismatch for " + key + ": expected " + std::string(ToString(entry->kind)) + ", got " +
                                         std::string(ToString(kind)));
  }
  return *entry;
}

std::vector<std::string> RelationshipSchema::EntriesFrom(const std::string& service, const std::string& type) const {
  const auto               prefix = service + ":" + type + " -> ";
  std::vector<std::string> keys;
  for (const auto& [key, _] : entries_) {
    if (key.starts_with(prefix)) keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::vector<std::string> RelationshipSchema::EntriesTo(const std::string& service, const std::string& type) const {
  const auto               suffix = " -> " + service + ":" + type;
  std::vector<std::string> keys;
  for (const auto& [key, _] : entries_) {
    if (key.ends_with(suffix)) keys.push_back(key);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

} // namespace cloudsim::graph
