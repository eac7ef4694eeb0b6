#include "handler_support.hpp"

#include <algorithm>
#include <stdexcept>

namespace cloudsim::service {

using cloudsim::observability::StringField;

void ThrowIfStateError(const state::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == state::ErrorCode::NotFound) {
    throw util::NotFound(prefix + ": " + result.message);
  }
  throw std::runtime_error(prefix + ": " + result.message);
}

void DeleteIfPresent(state::StateStore& store, const std::string& key) {
  const auto result = store.Delete(key);
  if (!result && result.code != state::ErrorCode::NotFound) {
    throw std::runtime_error("delete " + key + ": " + result.message);
  }
}

void UndoDelete(state::StateStore& store, const std::string& key) {
  const auto result = store.Delete(key);
  if (!result && result.code != state::ErrorCode::NotFound) {
    CLOUDSIM_LOG_ERROR("rollback failed", {StringField("key", key), StringField("error", result.message)});
  }
}

void UndoRegister(graph::ResourceTracker& tracker, const graph::ResourceID& id) {
  if (!tracker.HasResource(id)) {
    return;
  }
  try {
    tracker.UnregisterResource(id);
  } catch (const std::exception& e) {
    CLOUDSIM_LOG_ERROR("rollback failed", {StringField("resource", id.String()), StringField("error", e.what())});
  }
}

bool Contains(const google::protobuf::RepeatedPtrField<std::string>& values, const std::string& value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

bool Erase(google::protobuf::RepeatedPtrField<std::string>* values, const std::string& value) {
  auto it = std::find(values->begin(), values->end(), value);
  if (it == values->end()) return false;
  values->erase(it);
  return true;
}

} // namespace cloudsim::service
