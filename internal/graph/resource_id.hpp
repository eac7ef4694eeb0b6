#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace cloudsim::graph {

/*
  Identity of any emulated resource across all services.

    service  "ec2", "iam", "rds"
    type     "vpc", "role", "access-key"
    id       "vpc-0a1b2c3d", "admin-role"
*/
struct ResourceID {
  std::string service;
  std::string type;
  std::string id;

  // "service:type:id"
  std::string String() const;

  // "service:type", used for schema lookups.
  std::string TypeKey() const;

  bool IsZero() const;

  bool operator==(const ResourceID&) const = default;
};

struct ResourceIDHash {
  std::size_t operator()(const ResourceID& id) const noexcept;
};

} // namespace cloudsim::graph

namespace std {
template <>
struct hash<cloudsim::graph::ResourceID> {
  size_t operator()(const cloudsim::graph::ResourceID& id) const noexcept {
    return cloudsim::graph::ResourceIDHash{}(id);
  }
};
} // namespace std
