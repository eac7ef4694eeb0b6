#include "resource_bookkeeping.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cloudsim::service {

using cloudsim::observability::StringField;

ResourceBookkeeping::ResourceBookkeeping(std::shared_ptr<graph::ResourceTracker> tracker) : tracker_(std::move(tracker)) {
  if (!tracker_) {
    tracker_ = std::make_shared<graph::NullResourceTracker>();
  }
}

void ResourceBookkeeping::Register(const graph::ResourceID& id, graph::Metadata metadata, const Rollback& rollback) {
  try {
    tracker_->RegisterResource(id, std::move(metadata));
  } catch (const std::exception& e) {
    Fail("register", id.String(), e, rollback);
  }
}

void ResourceBookkeeping::Unregister(const graph::ResourceID& id) {
  try {
    tracker_->UnregisterResource(id);
  } catch (const util::DependencyViolation&) {
    throw;
  } catch (const std::exception& e) {
    // Nothing has been removed from state yet, so there is nothing to undo.
    Fail("unregister", id.String(), e, {});
  }
}

void ResourceBookkeeping::Relate(const graph::ResourceID& from, const graph::ResourceID& to, graph::RelationshipKind kind, const Rollback& rollback) {
  try {
    tracker_->AddRelationship(from, to, kind);
  } catch (const std::exception& e) {
    Fail("relate", graph::Edge{from, to, kind}.String(), e, rollback);
  }
}

void ResourceBookkeeping::Unrelate(const graph::ResourceID& from, const graph::ResourceID& to, graph::RelationshipKind kind) {
  tracker_->RemoveRelationship(from, to, kind);
}

bool ResourceBookkeeping::Strict() const {
  return tracker_->IsStrictMode();
}

void ResourceBookkeeping::Fail(std::string_view action, const std::string& subject, const std::exception& cause, const Rollback& rollback) const {
  if (!Strict()) {
    CLOUDSIM_LOG_WARN("graph update failed; continuing", {StringField("action", action), StringField("subject", subject), StringField("error", cause.what())});
    return;
  }

  CLOUDSIM_LOG_ERROR("graph update failed; rolling back", {StringField("action", action), StringField("subject", subject), StringField("error", cause.what())});
  if (rollback) {
    rollback();
  }
  throw util::BookkeepingFailure("failed to " + std::string(action) + " " + subject + ": " + cause.what());
}

} // namespace cloudsim::service
