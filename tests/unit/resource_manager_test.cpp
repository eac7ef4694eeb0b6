#include "internal/graph/resource_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/graph/resource_tracker.hpp"
#include "internal/util/errors.hpp"

namespace {

using cloudsim::graph::NullResourceTracker;
using cloudsim::graph::RelationshipKind;
using cloudsim::graph::ResourceID;
using cloudsim::graph::ResourceManager;
using cloudsim::graph::ResourceManagerConfig;
using cloudsim::graph::ResourceTracker;

ResourceManagerConfig Unconstrained() {
  ResourceManagerConfig config;
  config.use_provider_schema = false;
  return config;
}

void TestVpcSubnetLifecycle() {
  ResourceManager  manager;
  const ResourceID vpc{"ec2", "vpc", "vpc-1"};
  const ResourceID subnet{"ec2", "subnet", "subnet-1"};

  manager.RegisterResource(vpc, {});
  manager.RegisterResource(subnet, {});
  manager.AddRelationship(vpc, subnet, RelationshipKind::kContains);

  auto check = manager.CanDelete(vpc);
  assert(!check.deletable);
  assert(check.blockers.size() == 1 && check.blockers[0] == subnet);

  manager.UnregisterResource(subnet);

  check = manager.CanDelete(vpc);
  assert(check.deletable);
  assert(check.blockers.empty());

  manager.UnregisterResource(vpc);
  assert(manager.ResourceCount() == 0);
  assert(manager.RelationshipCount() == 0);
}

void TestRegistrationIsUniqueUntilUnregistered() {
  ResourceManager  manager(Unconstrained());
  const ResourceID role{"iam", "role", "admin"};

  manager.RegisterResource(role, {{"arn", "arn:aws:iam::123456789012:role/admin"}});

  bool threw = false;
  try {
    manager.RegisterResource(role, {});
  } catch (const cloudsim::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  manager.UnregisterResource(role);
  manager.RegisterResource(role, {{"path", "/ops/"}});

  const auto node = manager.GetResource(role);
  assert(node.metadata.count("arn") == 0);
  assert(node.metadata.at("path") == "/ops/");
}

void TestRelationshipToUnknownResourceIsNotFound() {
  ResourceManager manager(Unconstrained());
  manager.RegisterResource({"test", "node", "a"}, {});

  bool threw = false;
  try {
    manager.AddRelationship({"test", "node", "a"}, {"test", "node", "ghost"}, RelationshipKind::kContains);
  } catch (const cloudsim::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(manager.RelationshipCount() == 0);
}

void TestRepeatedRelationshipIsStoredOnce() {
  ResourceManager  manager(Unconstrained());
  const ResourceID a{"test", "node", "a"};
  const ResourceID b{"test", "node", "b"};
  manager.RegisterResource(a, {});
  manager.RegisterResource(b, {});

  manager.AddRelationship(a, b, RelationshipKind::kContains);
  manager.AddRelationship(a, b, RelationshipKind::kContains);
  assert(manager.RelationshipCount() == 1);

  manager.RemoveRelationship(a, b, RelationshipKind::kContains);
  manager.RemoveRelationship(a, b, RelationshipKind::kContains);
  assert(manager.RelationshipCount() == 0);
}

void TestPolicyAttachmentBlocksRoleOnly() {
  ResourceManager  manager;
  const ResourceID policy{"iam", "policy", "ReadOnly"};
  const ResourceID role{"iam", "role", "reader"};
  manager.RegisterResource(policy, {});
  manager.RegisterResource(role, {});
  manager.AddRelationship(policy, role, RelationshipKind::kAssociatedWith);

  const auto role_check = manager.CanDelete(role);
  assert(!role_check.deletable);
  assert(role_check.blockers.size() == 1 && role_check.blockers[0] == policy);
  assert(manager.CanDelete(policy).deletable);

  bool threw = false;
  try {
    manager.UnregisterResource(role);
  } catch (const cloudsim::util::DependencyViolation& e) {
    threw = true;
    assert(e.Resource() == role);
    assert(e.Blockers().size() == 1 && e.Blockers()[0] == policy);
    assert(std::string(e.what()) == "cannot delete iam:role:reader: 1 dependent(s) exist [iam:policy:ReadOnly]");
  }
  assert(threw);
  assert(manager.HasResource(role));

  // Deleting the attaching side cascades the edge and frees the role.
  manager.UnregisterResource(policy);
  assert(manager.CanDelete(role).deletable);
}

void TestCycleIsRejectedThroughManager() {
  ResourceManager  manager(Unconstrained());
  const ResourceID a{"test", "node", "a"};
  const ResourceID b{"test", "node", "b"};
  const ResourceID c{"test", "node", "c"};
  manager.RegisterResource(a, {});
  manager.RegisterResource(b, {});
  manager.RegisterResource(c, {});
  manager.AddRelationship(a, b, RelationshipKind::kContains);
  manager.AddRelationship(b, c, RelationshipKind::kContains);

  bool threw = false;
  try {
    manager.AddRelationship(c, a, RelationshipKind::kContains);
  } catch (const cloudsim::util::WouldCreateCycle&) {
    threw = true;
  }
  assert(threw);
  assert(manager.RelationshipCount() == 2);

  const auto all = manager.GetAllDependents(a);
  assert(all.size() == 2 && all[0] == b && all[1] == c);
  assert(manager.GetDependencies(b).size() == 1 && manager.GetDependencies(b)[0] == a);
}

void TestSchemaIsAppliedByDefault() {
  ResourceManager manager;
  assert(manager.Schema() != nullptr);

  manager.RegisterResource({"ec2", "subnet", "s"}, {});
  manager.RegisterResource({"ec2", "vpc", "v"}, {});

  bool threw = false;
  try {
    manager.AddRelationship({"ec2", "subnet", "s"}, {"ec2", "vpc", "v"}, RelationshipKind::kContains);
  } catch (const cloudsim::util::SchemaViolation&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    manager.ValidateRelationship({"iam", "role", "r"}, {"iam", "policy", "p"}, RelationshipKind::kAssociatedWith);
  } catch (const cloudsim::util::SchemaViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownResourceQueries() {
  ResourceManager  manager(Unconstrained());
  const ResourceID ghost{"test", "node", "ghost"};

  assert(!manager.HasResource(ghost));
  assert(!manager.FindResource(ghost).has_value());

  bool threw = false;
  try {
    (void)manager.CanDelete(ghost);
  } catch (const cloudsim::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    manager.UnregisterResource(ghost);
  } catch (const cloudsim::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStrictModeFlag() {
  ResourceManagerConfig strict;
  strict.strict_validation = true;
  assert(ResourceManager(strict).IsStrictMode());
  assert(!ResourceManager().IsStrictMode());
}

void TestNullTrackerAcceptsEverything() {
  std::unique_ptr<ResourceTracker> tracker = std::make_unique<NullResourceTracker>();
  const ResourceID                 vpc{"ec2", "vpc", "v"};
  const ResourceID                 subnet{"ec2", "subnet", "s"};

  tracker->RegisterResource(vpc, {});
  tracker->RegisterResource(vpc, {});
  tracker->AddRelationship(vpc, subnet, RelationshipKind::kContains);
  tracker->AddRelationship(subnet, vpc, RelationshipKind::kContains);

  const auto check = tracker->CanDelete(vpc);
  assert(check.deletable);
  assert(check.blockers.empty());
  assert(!tracker->HasResource(vpc));
  assert(!tracker->FindResource(vpc).has_value());
  assert(!tracker->IsStrictMode());

  tracker->UnregisterResource(vpc);
  tracker->RemoveRelationship(vpc, subnet, RelationshipKind::kContains);
}

} // namespace

int main() {
  TestVpcSubnetLifecycle();
  TestRegistrationIsUniqueUntilUnregistered();
  TestRelationshipToUnknownResourceIsNotFound();
  TestRepeatedRelationshipIsStoredOnce();
  TestPolicyAttachmentBlocksRoleOnly();
  TestCycleIsRejectedThroughManager();
  TestSchemaIsAppliedByDefault();
  TestUnknownResourceQueries();
  TestStrictModeFlag();
  TestNullTrackerAcceptsEverything();

  std::cout << "cloudsim_unit_resource_manager: pass\n";
  return 0;
}
