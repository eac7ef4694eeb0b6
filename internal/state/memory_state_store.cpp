#include "memory_state_store.hpp"

#include <mutex>

namespace cloudsim::state::memory {

MemoryStateStore::MemoryStateStore() = default;

bool MemoryStateStore::Exists(const std::string& key) const {
  std::shared_lock lock(mutex_);
  return data_.contains(key);
}

std::optional<std::string> MemoryStateStore::Get(const std::string& key) const {
  std::shared_lock lock(mutex_);
  auto             it = data_.find(key);
  if (it == data_.end()) return std::nullopt;
  return it->second;
}

Result MemoryStateStore::Set(const std::string& key, std::string value) {
  std::unique_lock lock(mutex_);
  data_[key] = std::move(value);
  return Result::Ok();
}

Result MemoryStateStore::Insert(const std::string& key, std::string value) {
  std::unique_lock lock(mutex_);
  if (!data_.try_emplace(key, std::move(value)).second) {
    return Result::Err(ErrorCode::AlreadyExists, "key " + key + " already exists");
  }
  return Result::Ok();
}

Result MemoryStateStore::Delete(const std::string& key) {
  std::unique_lock lock(mutex_);
  if (data_.erase(key) == 0) return Result::Err(ErrorCode::NotFound, "key " + key + " not found");
  return Result::Ok();
}

std::vector<std::string> MemoryStateStore::List(const std::string& prefix) const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> keys;
  // std::map keeps keys ordered, so every match sits in one contiguous run.
  for (auto it = data_.lower_bound(prefix); it != data_.end() && it->first.starts_with(prefix); ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

Result MemoryStateStore::Update(const std::string& key, const Mutator& mutator) {
  std::unique_lock lock(mutex_);
  auto             it = data_.find(key);
  if (it == data_.end()) return Result::Err(ErrorCode::NotFound, "key " + key + " not found");

  // A failed mutator leaves the stored value untouched.
  auto working = it->second;
  auto result  = mutator(working);
  if (!result) return result;

  it->second = std::move(working);
  return Result::Ok();
}

Result MemoryStateStore::Upsert(const std::string& key, const Mutator& mutator) {
  std::unique_lock lock(mutex_);
  auto             it      = data_.find(key);
  std::string      working = it == data_.end() ? std::string() : it->second;

  auto result = mutator(working);
  if (!result) return result;

  if (it == data_.end()) {
    data_.emplace(key, std::move(working));
  } else {
    it->second = std::move(working);
  }
  return Result::Ok();
}

std::size_t MemoryStateStore::Size() const {
  std::shared_lock lock(mutex_);
  return data_.size();
}

} // namespace cloudsim::state::memory
