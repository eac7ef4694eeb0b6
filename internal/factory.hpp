#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/graph/resource_tracker.hpp"
#include "internal/service/identity_service.hpp"
#include "internal/service/network_service.hpp"
#include "internal/state/state_store.hpp"

namespace cloudsim::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one emulated account.
  Both services share the state store and the resource tracker.
*/
struct RuntimeDependencies {
  std::shared_ptr<state::StateStore>      state;
  std::shared_ptr<graph::ResourceTracker> resources;

  std::shared_ptr<service::IdentityService> identity_service;
  std::shared_ptr<service::NetworkService>  network_service;
};

/*
  BuildRuntime

  Constructs the emulator backend from runtime config.

  NOTE:
  This is the composition root. It is the ONLY place that picks the
  concrete tracker (ResourceManager or NullResourceTracker) and store.
*/
RuntimeDependencies BuildRuntime(const cloudsim::runtime::config::RuntimeConfig& config);

} // namespace cloudsim::factory
