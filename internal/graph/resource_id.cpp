#include "internal/graph/resource_id.hpp"

namespace cloudsim::graph {

std::string ResourceID::String() const {
  return service + ":" + type + ":" + id;
}

std::string ResourceID::TypeKey() const {
  return service + ":" + type;
}

bool ResourceID::IsZero() const {
  return service.empty() && type.empty() && id.empty();
}

std::size_t ResourceIDHash::operator()(const ResourceID& id) const noexcept {
  std::hash<std::string> hasher;
  std::size_t            seed = hasher(id.service);
  seed ^= hasher(id.type) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  seed ^= hasher(id.id) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  return seed;
}

} // namespace cloudsim::graph
