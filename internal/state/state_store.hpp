#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/state/result.hpp"

namespace cloudsim::state {

/*
  Key-value store behind every emulated service.

  Values are opaque byte strings; services store serialized protobuf
  records (see GetRecord / PutRecord below). Keys are namespaced by the
  caller, e.g. "iam:role:admin".

  Update() is an atomic read-modify-write: the mutator sees the current
  value and the change is published only if it returns Ok. Upsert() is the
  same but starts from an empty value when the key is absent.
*/
class StateStore {
 public:
  using Mutator = std::function<Result(std::string& value)>;

  virtual ~StateStore() = default;

  virtual bool Exists(const std::string& key) const = 0;

  virtual std::optional<std::string> Get(const std::string& key) const = 0;

  virtual Result Set(const std::string& key, std::string value) = 0;

  // AlreadyExists when the key is present; the stored value is kept.
  virtual Result Insert(const std::string& key, std::string value) = 0;

  // NotFound when the key is absent.
  virtual Result Delete(const std::string& key) = 0;

  // Keys starting with `prefix`, sorted.
  virtual std::vector<std::string> List(const std::string& prefix) const = 0;

  // NotFound when the key is absent.
  virtual Result Update(const std::string& key, const Mutator& mutator) = 0;

  virtual Result Upsert(const std::string& key, const Mutator& mutator) = 0;
};

// ---------------------------------------------------------------------
// Protobuf record helpers
// ---------------------------------------------------------------------

template <typename Record>
std::optional<Record> GetRecord(const StateStore& store, const std::string& key) {
  auto raw = store.Get(key);
  if (!raw.has_value()) return std::nullopt;

  Record record;
  if (!record.ParseFromString(*raw)) return std::nullopt;
  return record;
}

template <typename Record>
Result PutRecord(StateStore& store, const std::string& key, const Record& record) {
  std::string raw;
  if (!record.SerializeToString(&raw)) {
    return Result::Err(ErrorCode::Corruption, "failed to serialize record for " + key);
  }
  return store.Set(key, std::move(raw));
}

template <typename Record>
Result InsertRecord(StateStore& store, const std::string& key, const Record& record) {
  std::string raw;
  if (!record.SerializeToString(&raw)) {
    return Result::Err(ErrorCode::Corruption, "failed to serialize record for " + key);
  }
  return store.Insert(key, std::move(raw));
}

namespace detail {

template <typename Record>
StateStore::Mutator RecordMutator(const std::string& key, const std::function<Result(Record&)>& mutator) {
  return [&key, &mutator](std::string& raw) {
    Record record;
    if (!record.ParseFromString(raw)) {
      return Result::Err(ErrorCode::Corruption, "failed to parse record at " + key);
    }
    auto result = mutator(record);
    if (!result) return result;
    if (!record.SerializeToString(&raw)) {
      return Result::Err(ErrorCode::Corruption, "failed to serialize record for " + key);
    }
    return Result::Ok();
  };
}

} // namespace detail

template <typename Record>
Result UpdateRecord(StateStore& store, const std::string& key, const std::function<Result(Record&)>& mutator) {
  return store.Update(key, detail::RecordMutator<Record>(key, mutator));
}

// The mutator sees a default record when the key is absent.
template <typename Record>
Result UpsertRecord(StateStore& store, const std::string& key, const std::function<Result(Record&)>& mutator) {
  return store.Upsert(key, detail::RecordMutator<Record>(key, mutator));
}

} // namespace cloudsim::state
