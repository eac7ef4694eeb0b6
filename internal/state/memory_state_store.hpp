#pragma once

#include <map>
#include <shared_mutex>

#include "internal/state/state_store.hpp"

namespace cloudsim::state::memory {

class MemoryStateStore final : public StateStore {
 public:
  MemoryStateStore();

  bool                       Exists(const std::string& key) const override;
  std::optional<std::string> Get(const std::string& key) const override;
  Result                     Set(const std::string& key, std::string value) override;
  Result                     Insert(const std::string& key, std::string value) override;
  Result                     Delete(const std::string& key) override;
  std::vector<std::string>   List(const std::string& prefix) const override;
  Result                     Update(const std::string& key, const Mutator& mutator) override;
  Result                     Upsert(const std::string& key, const Mutator& mutator) override;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex          mutex_;
  std::map<std::string, std::string> data_;
};

} // namespace cloudsim::state::memory
