#include <cassert>

#include <iostream>
#include <memory>
#include <string>

#include "internal/graph/default_topology.hpp"
#include "internal/graph/resource_manager.hpp"
#include "internal/service/api_error.hpp"
#include "internal/service/network_service.hpp"
#include "internal/state/memory_state_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using cloudsim::graph::ResourceID;
using cloudsim::graph::ResourceManager;
using cloudsim::graph::ResourceManagerConfig;
using cloudsim::service::ErrorDialect;
using cloudsim::service::NetworkService;
using cloudsim::service::ServiceContext;
using cloudsim::service::ToApiError;
using cloudsim::state::memory::MemoryStateStore;

ServiceContext MakeContext(std::shared_ptr<ResourceManager> manager) {
  ServiceContext ctx;
  ctx.state     = std::make_shared<MemoryStateStore>();
  ctx.resources = std::move(manager);
  return ctx;
}

ResourceID Ec2(const std::string& type, const std::string& id) {
  return {"ec2", type, id};
}

void TestDefaultVpcIsSeededAndProtected() {
  auto           manager = std::make_shared<ResourceManager>();
  NetworkService ec2(MakeContext(manager));

  assert(manager->HasResource(cloudsim::graph::defaults::Vpc()));
  assert(ec2.DescribeVpc("vpc-default").is_default());
  assert(ec2.DescribeVpcs().size() == 1);
  assert(ec2.DescribeSubnet("subnet-default").default_for_az());

  bool threw = false;
  try {
    ec2.DeleteVpc("vpc-default");
  } catch (const cloudsim::util::OperationNotPermitted& e) {
    threw = true;
    const auto api = ToApiError(e, ErrorDialect::kNetwork);
    assert(api.http_status == 400 && api.code == "OperationNotPermitted");
  }
  assert(threw);

  threw = false;
  try {
    ec2.DeleteSubnet("subnet-default");
  } catch (const cloudsim::util::OperationNotPermitted&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ec2.DeleteSecurityGroup("sg-default");
  } catch (const cloudsim::util::OperationNotPermitted&) {
    threw = true;
  }
  assert(threw);
  assert(manager->ResourceCount() == 5);
}

void TestSeededManagerIsNotSeededTwice() {
  ResourceManagerConfig config;
  config.seed_network_defaults = true;
  auto manager                 = std::make_shared<ResourceManager>(config);

  NetworkService ec2(MakeContext(manager));
  assert(manager->ResourceCount() == 5);
  assert(manager->RelationshipCount() == 4);
}

void TestVpcWithSubnetCannotBeDeleted() {
  auto           manager = std::make_shared<ResourceManager>();
  NetworkService ec2(MakeContext(manager));

  const auto vpc = ec2.CreateVpc("10.0.0.0/16");
  assert(vpc.vpc_id().rfind("vpc-", 0) == 0 && vpc.vpc_id().size() == 21);
  assert(!vpc.is_default());

  const auto subnet = ec2.CreateSubnet(vpc.vpc_id(), "10.0.1.0/24");
  assert(subnet.vpc_id() == vpc.vpc_id());

  bool threw = false;
  try {
    ec2.DeleteVpc(vpc.vpc_id());
  } catch (const cloudsim::util::DependencyViolation& e) {
    threw = true;
    assert(e.Blockers().size() == 1 && e.Blockers()[0] == Ec2("subnet", subnet.subnet_id()));
    const auto api = ToApiError(e, ErrorDialect::kNetwork);
    assert(api.http_status == 400 && api.code == "DependencyViolation");
  }
  assert(threw);
  assert(ec2.DescribeVpc(vpc.vpc_id()).vpc_id() == vpc.vpc_id());

  ec2.DeleteSubnet(subnet.subnet_id());
  ec2.DeleteVpc(vpc.vpc_id());

  assert(ec2.DescribeVpcs().size() == 1);
  assert(manager->ResourceCount() == 5);
}

void TestNewVpcOwnsMainRouteTableAndDefaultGroup() {
  auto           manager = std::make_shared<ResourceManager>();
  NetworkService ec2(MakeContext(manager));

  const auto vpc    = ec2.CreateVpc("10.1.0.0/16");
  const auto suffix = vpc.vpc_id().substr(4);

  const auto sg = ec2.DescribeSecurityGroup("sg-" + suffix);
  assert(sg.is_default() && sg.group_name() == "default");

  const auto blockers = manager->GetDependents(Ec2("vpc", vpc.vpc_id()));
  assert(blockers.size() == 2);
  assert(blockers[0] == Ec2("route-table", "rtb-" + suffix));
  assert(blockers[1] == Ec2("security-group", "sg-" + suffix));

  bool threw = false;
  try {
    ec2.DeleteRouteTable("rtb-" + suffix);
  } catch (const cloudsim::util::OperationNotPermitted&) {
    threw = true;
  }
  assert(threw);

  ec2.DeleteVpc(vpc.vpc_id());
  assert(!manager->HasResource(Ec2("security-group", "sg-" + suffix)));

  threw = false;
  try {
    (void)ec2.DescribeSecurityGroup("sg-" + suffix);
  } catch (const cloudsim::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestInstanceBlocksSecurityGroupUntilTerminated() {
  auto           manager = std::make_shared<ResourceManager>();
  NetworkService ec2(MakeContext(manager));

  const auto vpc    = ec2.CreateVpc("10.2.0.0/16");
  const auto subnet = ec2.CreateSubnet(vpc.vpc_id(), "10.2.0.0/24");
  const auto sg     = ec2.CreateSecurityGroup(vpc.vpc_id(), "web", "web tier");

  const auto instance = ec2.RunInstance(subnet.subnet_id(), {sg.group_id()});
  assert(instance.state() == "running");

  bool threw = false;
  try {
    ec2.DeleteSecurityGroup(sg.group_id());
  } catch (const cloudsim::util::DependencyViolation& e) {
    threw = true;
    assert(e.Blockers().size() == 1 && e.Blockers()[0] == Ec2("instance", instance.instance_id()));
  }
  assert(threw);

  threw = false;
  try {
    ec2.DeleteSubnet(subnet.subnet_id());
  } catch (const cloudsim::util::DependencyViolation&) {
    threw = true;
  }
  assert(threw);

  ec2.TerminateInstance(instance.instance_id());
  ec2.TerminateInstance(instance.instance_id());
  assert(ec2.DescribeInstance(instance.instance_id()).state() == "terminated");

  ec2.DeleteSecurityGroup(sg.group_id());
  ec2.DeleteSubnet(subnet.subnet_id());
  ec2.DeleteVpc(vpc.vpc_id());
}

void TestInstanceDefaultsToVpcSecurityGroup() {
  auto           manager = std::make_shared<ResourceManager>();
  NetworkService ec2(MakeContext(manager));

  const auto instance = ec2.RunInstance("subnet-default");
  assert(instance.security_group_ids_size() == 1);
  assert(instance.security_group_ids(0) == "sg-default");

  const auto blocked = manager->GetDependencies(Ec2("instance", instance.instance_id()));
  assert(blocked.size() == 2);
  assert(blocked[0] == Ec2("subnet", "subnet-default"));
  assert(blocked[1] == Ec2("security-group", "sg-default"));
}

void TestInvalidNetworkInput() {
  NetworkService ec2(MakeContext(std::make_shared<ResourceManager>()));

  bool threw = false;
  try {
    ec2.CreateVpc("10.0.0.0/8");
  } catch (const cloudsim::util::InvalidArgument& e) {
    threw = true;
    assert(ToApiError(e, ErrorDialect::kNetwork).code == "InvalidParameterValue");
  }
  assert(threw);

  const auto vpc = ec2.CreateVpc("10.3.0.0/16");
  threw          = false;
  try {
    ec2.CreateSubnet(vpc.vpc_id(), "10.4.0.0/24");
  } catch (const cloudsim::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "Subnets must lie inside their VPC.");

  ec2.CreateSubnet(vpc.vpc_id(), "10.3.0.0/24");
  threw = false;
  try {
    ec2.CreateSubnet(vpc.vpc_id(), "10.3.0.0/25");
  } catch (const cloudsim::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw && "Sibling subnets must not overlap.");

  threw = false;
  try {
    ec2.CreateSecurityGroup(vpc.vpc_id(), "default", "reserved");
  } catch (const cloudsim::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  ec2.CreateSecurityGroup(vpc.vpc_id(), "db", "database");
  threw = false;
  try {
    ec2.CreateSecurityGroup(vpc.vpc_id(), "db", "again");
  } catch (const cloudsim::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ec2.RunInstance("subnet-default", {"sg-default", "sg-missing"});
  } catch (const cloudsim::util::NotFound& e) {
    threw = true;
    assert(ToApiError(e, ErrorDialect::kNetwork).code == "InvalidResourceID.NotFound");
  }
  assert(threw);
}

void TestCrossVpcSecurityGroupIsRejected() {
  NetworkService ec2(MakeContext(std::make_shared<ResourceManager>()));

  const auto vpc = ec2.CreateVpc("10.5.0.0/16");
  const auto sg  = ec2.CreateSecurityGroup(vpc.vpc_id(), "app", "app tier");

  bool threw = false;
  try {
    ec2.RunInstance("subnet-default", {sg.group_id()});
  } catch (const cloudsim::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestWithoutTrackingOnlyDefaultsAreProtected() {
  NetworkService ec2(MakeContext(nullptr));

  const auto vpc = ec2.CreateVpc("10.6.0.0/16");
  ec2.CreateSubnet(vpc.vpc_id(), "10.6.1.0/24");
  ec2.DeleteVpc(vpc.vpc_id());

  bool threw = false;
  try {
    ec2.DeleteVpc("vpc-default");
  } catch (const cloudsim::util::OperationNotPermitted&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultVpcIsSeededAndProtected();
  TestSeededManagerIsNotSeededTwice();
  TestVpcWithSubnetCannotBeDeleted();
  TestNewVpcOwnsMainRouteTableAndDefaultGroup();
  TestInstanceBlocksSecurityGroupUntilTerminated();
  TestInstanceDefaultsToVpcSecurityGroup();
  TestInvalidNetworkInput();
  TestCrossVpcSecurityGroupIsRejected();
  TestWithoutTrackingOnlyDefaultsAreProtected();

  std::cout << "cloudsim_unit_network_service: pass\n";
  return 0;
}
