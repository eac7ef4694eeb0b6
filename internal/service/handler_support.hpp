#pragma once

#include <google/protobuf/repeated_ptr_field.h>

#include <functional>
#include <string>

#include "internal/graph/resource_id.hpp"
#include "internal/graph/resource_tracker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/state/state_store.hpp"
#include "internal/util/errors.hpp"

namespace cloudsim::service {

// Store failures become util::NotFound or std::runtime_error.
void ThrowIfStateError(const state::Result& result, const std::string& prefix);

// Throws util::NotFound(missing) when the key is absent.
template <typename Record>
Record Require(const state::StateStore& store, const std::string& key, const std::string& missing) {
  auto record = state::GetRecord<Record>(store, key);
  if (!record) {
    throw util::NotFound(missing);
  }
  return *record;
}

void DeleteIfPresent(state::StateStore& store, const std::string& key);

// ---------------------------------------------------------------------
// Rollback steps
//
// These run while an error is already propagating; their own failures are
// logged, not thrown.
// ---------------------------------------------------------------------

void UndoDelete(state::StateStore& store, const std::string& key);

void UndoRegister(graph::ResourceTracker& tracker, const graph::ResourceID& id);

// Reverses one change to a stored record; other writers' changes stay.
template <typename Record>
void UndoUpdate(state::StateStore& store, const std::string& key, const std::function<void(Record&)>& undo) {
  const auto result = state::UpdateRecord<Record>(store, key, [&undo](Record& record) {
    undo(record);
    return state::Result::Ok();
  });
  if (!result) {
    CLOUDSIM_LOG_ERROR("rollback failed", {observability::StringField("key", key), observability::StringField("error", result.message)});
  }
}

bool Contains(const google::protobuf::RepeatedPtrField<std::string>& values, const std::string& value);
bool Erase(google::protobuf::RepeatedPtrField<std::string>* values, const std::string& value);

} // namespace cloudsim::service
