#pragma once

#include <memory>

namespace cloudsim::graph { class ResourceTracker; }
namespace cloudsim::state { class StateStore; }

namespace cloudsim::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<cloudsim::state::StateStore> state;
  std::shared_ptr<cloudsim::graph::ResourceTracker> resources;
};

}
