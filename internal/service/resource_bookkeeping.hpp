#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "internal/graph/resource_id.hpp"
#include "internal/graph/resource_tracker.hpp"
#include "internal/graph/types.hpp"

namespace cloudsim::service {

/*
  Applies a handler's graph updates under the tracker's consistency policy.

  Strict mode: a failed update runs `rollback` (when given) and is rethrown
  as util::BookkeepingFailure.
  Permissive mode: the failure is logged as a warning and the handler
  carries on.

  DependencyViolation from Unregister() is always rethrown as is.
*/
class ResourceBookkeeping {
 public:
  using Rollback = std::function<void()>;

  explicit ResourceBookkeeping(std::shared_ptr<graph::ResourceTracker> tracker);

  void Register(const graph::ResourceID& id, graph::Metadata metadata, const Rollback& rollback = {});
  void Unregister(const graph::ResourceID& id);

  void Relate(const graph::ResourceID& from, const graph::ResourceID& to, graph::RelationshipKind kind, const Rollback& rollback = {});
  void Unrelate(const graph::ResourceID& from, const graph::ResourceID& to, graph::RelationshipKind kind);

  bool Strict() const;

  graph::ResourceTracker& Tracker() const {
    return *tracker_;
  }

 private:
  void Fail(std::string_view action, const std::string& subject, const std::exception& cause, const Rollback& rollback) const;

  std::shared_ptr<graph::ResourceTracker> tracker_;
};

} // namespace cloudsim::service
