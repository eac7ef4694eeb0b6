#include <cassert>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "cloudsim/v1.hpp"
#include "internal/state/memory_state_store.hpp"

namespace {

using cloudsim::state::ErrorCode;
using cloudsim::state::Result;
using cloudsim::state::memory::MemoryStateStore;

void TestSetGetDelete() {
  MemoryStateStore store;
  assert(!store.Exists("iam:role:admin"));
  assert(!store.Get("iam:role:admin").has_value());

  assert(store.Set("iam:role:admin", "v1"));
  assert(store.Exists("iam:role:admin"));
  assert(*store.Get("iam:role:admin") == "v1");

  assert(store.Set("iam:role:admin", "v2"));
  assert(*store.Get("iam:role:admin") == "v2");
  assert(store.Size() == 1);

  assert(store.Delete("iam:role:admin"));
  const auto again = store.Delete("iam:role:admin");
  assert(!again);
  assert(again.code == ErrorCode::NotFound);
}

void TestListIsPrefixScopedAndSorted() {
  MemoryStateStore store;
  (void)store.Set("iam:user:carol", "");
  (void)store.Set("iam:user:alice", "");
  (void)store.Set("iam:users-extra", "");
  (void)store.Set("iam:role:admin", "");
  (void)store.Set("iam:user:bob", "");

  const auto users = store.List("iam:user:");
  assert(users.size() == 3);
  assert(users[0] == "iam:user:alice");
  assert(users[1] == "iam:user:bob");
  assert(users[2] == "iam:user:carol");

  assert(store.List("ec2:").empty());
  assert(store.List("").size() == 5);
}

void TestUpdateIsAtomicAndRejectsMissingKeys() {
  MemoryStateStore store;

  auto missing = store.Update("absent", [](std::string&) { return Result::Ok(); });
  assert(missing.code == ErrorCode::NotFound);

  (void)store.Set("counter", "a");
  auto failed = store.Update("counter", [](std::string& value) {
    value += "b";
    return Result::Err(ErrorCode::Conflict, "no");
  });
  assert(failed.code == ErrorCode::Conflict);
  assert(*store.Get("counter") == "a" && "A failed mutator must not publish its change.");

  assert(store.Update("counter", [](std::string& value) {
    value += "b";
    return Result::Ok();
  }));
  assert(*store.Get("counter") == "ab");
}

void TestInsertKeepsTheFirstWriter() {
  MemoryStateStore store;

  assert(store.Insert("iam:user:alice", "first"));
  auto second = store.Insert("iam:user:alice", "second");
  assert(second.code == ErrorCode::AlreadyExists);
  assert(*store.Get("iam:user:alice") == "first");

  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&store, &winners, t] {
      if (store.Insert("iam:user:bob", std::to_string(t))) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();
  assert(winners.load() == 1);
}

void TestUpsertStartsFromEmpty() {
  MemoryStateStore store;

  assert(store.Upsert("list", [](std::string& value) {
    assert(value.empty());
    value = "a";
    return Result::Ok();
  }));
  assert(store.Upsert("list", [](std::string& value) {
    value += "b";
    return Result::Ok();
  }));
  assert(*store.Get("list") == "ab");

  auto failed = store.Upsert("other", [](std::string& value) {
    value = "x";
    return Result::Err(ErrorCode::Conflict, "no");
  });
  assert(failed.code == ErrorCode::Conflict);
  assert(!store.Exists("other") && "A failed mutator must not create the key.");
}

void TestConcurrentUpdatesAreSerialized() {
  MemoryStateStore store;
  (void)store.Set("n", "");

  constexpr int            kThreads = 8;
  constexpr int            kAppends = 250;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store] {
      for (int i = 0; i < kAppends; ++i) {
        auto result = store.Update("n", [](std::string& value) {
          value.push_back('x');
          return Result::Ok();
        });
        assert(result);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(store.Get("n")->size() == static_cast<std::size_t>(kThreads * kAppends));
}

void TestRecordHelpers() {
  MemoryStateStore store;

  cloudsim::v1::RoleRecord role;
  role.set_name("admin");
  role.set_path("/");
  assert(cloudsim::state::PutRecord(store, "iam:role:admin", role));

  auto loaded = cloudsim::state::GetRecord<cloudsim::v1::RoleRecord>(store, "iam:role:admin");
  assert(loaded.has_value());
  assert(loaded->name() == "admin");

  auto updated = cloudsim::state::UpdateRecord<cloudsim::v1::RoleRecord>(store, "iam:role:admin", [](cloudsim::v1::RoleRecord& record) {
    record.set_path("/ops/");
    return Result::Ok();
  });
  assert(updated);
  assert(cloudsim::state::GetRecord<cloudsim::v1::RoleRecord>(store, "iam:role:admin")->path() == "/ops/");

  assert(!cloudsim::state::GetRecord<cloudsim::v1::RoleRecord>(store, "iam:role:ghost").has_value());
}

} // namespace

int main() {
  TestSetGetDelete();
  TestListIsPrefixScopedAndSorted();
  TestUpdateIsAtomicAndRejectsMissingKeys();
  TestInsertKeepsTheFirstWriter();
  TestUpsertStartsFromEmpty();
  TestConcurrentUpdatesAreSerialized();
  TestRecordHelpers();

  std::cout << "cloudsim_unit_memory_state_store: pass\n";
  return 0;
}
