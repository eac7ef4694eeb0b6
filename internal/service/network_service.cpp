#include "network_service.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <utility>

#include "handler_support.hpp"
#include "internal/graph/default_topology.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "observe.hpp"

namespace cloudsim::service {

using namespace cloudsim::v1;
using cloudsim::graph::RelationshipKind;
using cloudsim::graph::ResourceID;
using cloudsim::observability::StringField;

namespace defaults = cloudsim::graph::defaults;

namespace {

constexpr const char* kVpcPrefix           = "ec2:vpcs:";
constexpr const char* kSubnetPrefix        = "ec2:subnets:";
constexpr const char* kSecurityGroupPrefix = "ec2:security-groups:";
constexpr const char* kRouteTablePrefix    = "ec2:route-tables:";
constexpr const char* kNetworkAclPrefix    = "ec2:network-acls:";
constexpr const char* kInstancePrefix      = "ec2:instances:";

constexpr int kMinPrefixLength = 16;
constexpr int kMaxPrefixLength = 28;

ResourceID Ec2Id(std::string type, std::string id) {
  return ResourceID{"ec2", std::move(type), std::move(id)};
}

struct Cidr {
  uint32_t base   = 0;
  int      prefix = 0;
};

uint32_t Mask(int prefix) {
  return prefix == 0 ? 0u : 0xFFFFFFFFu << (32 - prefix);
}

std::optional<Cidr> ParseCidr(const std::string& text) {
  unsigned a = 0, b = 0, c = 0, d = 0;
  int      prefix = 0;
  char     tail   = 0;
  if (std::sscanf(text.c_str(), "%u.%u.%u.%u/%d%c", &a, &b, &c, &d, &prefix, &tail) != 5) {
    return std::nullopt;
  }
  if (a > 255 || b > 255 || c > 255 || d > 255 || prefix < 0 || prefix > 32) {
    return std::nullopt;
  }
  return Cidr{(a << 24) | (b << 16) | (c << 8) | d, prefix};
}

Cidr RequireCidr(const std::string& text) {
  auto cidr = ParseCidr(text);
  if (!cidr || cidr->prefix < kMinPrefixLength || cidr->prefix > kMaxPrefixLength) {
    throw util::InvalidArgument("Value (" + text + ") for parameter cidrBlock is invalid. This is not a valid CIDR block.");
  }
  return *cidr;
}

bool Within(const Cidr& inner, const Cidr& outer) {
  return inner.prefix >= outer.prefix && (inner.base & Mask(outer.prefix)) == (outer.base & Mask(outer.prefix));
}

bool Overlaps(const Cidr& a, const Cidr& b) {
  return Within(a, b) || Within(b, a);
}

template <typename Record>
std::vector<Record> ListRecords(const state::StateStore& store, const std::string& prefix) {
  std::vector<Record> records;
  for (const auto& key : store.List(prefix)) {
    if (auto record = state::GetRecord<Record>(store, key)) {
      records.push_back(std::move(*record));
    }
  }
  return records;
}

template <typename Record>
void PutIfAbsent(state::StateStore& store, const std::string& key, const Record& record) {
  const auto result = state::InsertRecord(store, key, record);
  if (result.code == state::ErrorCode::AlreadyExists) return;
  ThrowIfStateError(result, "store " + key);
}

std::string SuffixOf(const std::string& vpc_id) {
  return vpc_id.substr(vpc_id.find('-') + 1);
}

} // namespace

NetworkService::NetworkService(ServiceContext ctx) : ctx_(std::move(ctx)), graph_(ctx_.resources) {
  if (!ctx_.state) {
    throw std::invalid_argument("NetworkService: state store is required");
  }
  InitializeDefaults();
}

void NetworkService::InitializeDefaults() {
  VpcRecord vpc;
  vpc.set_vpc_id(defaults::kVpcId);
  vpc.set_cidr_block(defaults::kVpcCidr);
  vpc.set_state("available");
  vpc.set_is_default(true);
  PutIfAbsent(*ctx_.state, kVpcPrefix + vpc.vpc_id(), vpc);

  SubnetRecord subnet;
  subnet.set_subnet_id(defaults::kSubnetId);
  subnet.set_vpc_id(defaults::kVpcId);
  subnet.set_cidr_block(defaults::kSubnetCidr);
  subnet.set_availability_zone("us-east-1a");
  subnet.set_default_for_az(true);
  PutIfAbsent(*ctx_.state, kSubnetPrefix + subnet.subnet_id(), subnet);

  NetworkAclRecord acl;
  acl.set_network_acl_id(defaults::kNetworkAclId);
  acl.set_vpc_id(defaults::kVpcId);
  acl.set_is_default(true);
  PutIfAbsent(*ctx_.state, kNetworkAclPrefix + acl.network_acl_id(), acl);

  RouteTableRecord rtb;
  rtb.set_route_table_id(defaults::kRouteTableId);
  rtb.set_vpc_id(defaults::kVpcId);
  rtb.set_main(true);
  PutIfAbsent(*ctx_.state, kRouteTablePrefix + rtb.route_table_id(), rtb);

  SecurityGroupRecord sg;
  sg.set_group_id(defaults::kSecurityGroupId);
  sg.set_group_name("default");
  sg.set_description("default VPC security group");
  sg.set_vpc_id(defaults::kVpcId);
  sg.set_is_default(true);
  PutIfAbsent(*ctx_.state, kSecurityGroupPrefix + sg.group_id(), sg);

  // A manager built with seed_network_defaults already holds these.
  auto& tracker = graph_.Tracker();
  if (!tracker.HasResource(defaults::Vpc())) {
    graph::SeedDefaultNetworkTopology(tracker);
  }
}

bool NetworkService::IsDefault(const ResourceID& id, bool record_flag) const {
  if (record_flag) return true;
  const auto node = graph_.Tracker().FindResource(id);
  return node && node->IsDefault();
}

// ---------------------------------------------------------------------
// VPCs
// ---------------------------------------------------------------------

VpcRecord NetworkService::CreateVpc(const std::string& cidr_block) {
  return ObserveOperation("ec2.CreateVpc", [&] {
    RequireCidr(cidr_block);

    VpcRecord vpc;
    vpc.set_vpc_id(util::GenerateNetworkId("vpc"));
    vpc.set_cidr_block(cidr_block);
    vpc.set_state("available");
    vpc.set_is_default(false);

    // The main route table and default security group share the VPC suffix.
    RouteTableRecord rtb;
    rtb.set_route_table_id("rtb-" + SuffixOf(vpc.vpc_id()));
    rtb.set_vpc_id(vpc.vpc_id());
    rtb.set_main(true);

    SecurityGroupRecord sg;
    sg.set_group_id("sg-" + SuffixOf(vpc.vpc_id()));
    sg.set_group_name("default");
    sg.set_description("default VPC security group");
    sg.set_vpc_id(vpc.vpc_id());
    sg.set_is_default(true);

    const auto vpc_key = kVpcPrefix + vpc.vpc_id();
    const auto rtb_key = kRouteTablePrefix + rtb.route_table_id();
    const auto sg_key  = kSecurityGroupPrefix + sg.group_id();

    ThrowIfStateError(state::PutRecord(*ctx_.state, vpc_key, vpc), "store vpc");
    ThrowIfStateError(state::PutRecord(*ctx_.state, rtb_key, rtb), "store route table");
    ThrowIfStateError(state::PutRecord(*ctx_.state, sg_key, sg), "store security group");

    const auto vpc_id = Ec2Id("vpc", vpc.vpc_id());
    const auto rtb_id = Ec2Id("route-table", rtb.route_table_id());
    const auto sg_id  = Ec2Id("security-group", sg.group_id());

    const auto rollback = [&] {
      UndoRegister(graph_.Tracker(), sg_id);
      UndoRegister(graph_.Tracker(), rtb_id);
      UndoRegister(graph_.Tracker(), vpc_id);
      UndoDelete(*ctx_.state, sg_key);
      UndoDelete(*ctx_.state, rtb_key);
      UndoDelete(*ctx_.state, vpc_key);
    };

    graph_.Register(vpc_id, {{"cidrBlock", cidr_block}}, rollback);
    graph_.Register(rtb_id, {{"vpcId", vpc.vpc_id()}, {"main", "true"}}, rollback);
    graph_.Relate(vpc_id, rtb_id, RelationshipKind::kContains, rollback);
    graph_.Register(sg_id, {{"name", "default"}, {"vpcId", vpc.vpc_id()}}, rollback);
    graph_.Relate(vpc_id, sg_id, RelationshipKind::kContains, rollback);

    return vpc;
  });
}

VpcRecord NetworkService::DescribeVpc(const std::string& vpc_id) const {
  return Require<VpcRecord>(*ctx_.state, kVpcPrefix + vpc_id, "The vpc ID '" + vpc_id + "' does not exist");
}

std::vector<VpcRecord> NetworkService::DescribeVpcs() const {
  return ListRecords<VpcRecord>(*ctx_.state, kVpcPrefix);
}

void NetworkService::DeleteVpc(const std::string& vpc_id) {
  ObserveOperation("ec2.DeleteVpc", [&] {
    const auto vpc = Require<VpcRecord>(*ctx_.state, kVpcPrefix + vpc_id, "The vpc ID '" + vpc_id + "' does not exist");
    const auto id  = Ec2Id("vpc", vpc_id);

    if (IsDefault(id, vpc.is_default())) {
      throw util::OperationNotPermitted("Cannot delete the default VPC");
    }

    // Resources that go away with the VPC.
    std::vector<ResourceID>  owned;
    std::vector<std::string> owned_keys;
    for (const auto& rtb : ListRecords<RouteTableRecord>(*ctx_.state, kRouteTablePrefix)) {
      if (rtb.vpc_id() == vpc_id && rtb.main()) {
        owned.push_back(Ec2Id("route-table", rtb.route_table_id()));
        owned_keys.push_back(kRouteTablePrefix + rtb.route_table_id());
      }
    }
    for (const auto& sg : ListRecords<SecurityGroupRecord>(*ctx_.state, kSecurityGroupPrefix)) {
      if (sg.vpc_id() == vpc_id && sg.is_default()) {
        owned.push_back(Ec2Id("security-group", sg.group_id()));
        owned_keys.push_back(kSecurityGroupPrefix + sg.group_id());
      }
    }

    auto& tracker = graph_.Tracker();
    if (tracker.HasResource(id)) {
      auto check = tracker.CanDelete(id);
      std::vector<ResourceID> blockers;
      std::copy_if(check.blockers.begin(), check.blockers.end(), std::back_inserter(blockers),
                   [&](const ResourceID& blocker) { return std::find(owned.begin(), owned.end(), blocker) == owned.end(); });
      if (!blockers.empty()) {
        throw util::DependencyViolation(id, std::move(blockers));
      }
    }

    // Children before the VPC; a referenced default group stops the delete
    // before any state is touched.
    for (auto it = owned.rbegin(); it != owned.rend(); ++it) {
      graph_.Unregister(*it);
    }
    graph_.Unregister(id);

    for (const auto& key : owned_keys) {
      DeleteIfPresent(*ctx_.state, key);
    }
    ThrowIfStateError(ctx_.state->Delete(kVpcPrefix + vpc_id), "delete vpc");
  });
}

// ---------------------------------------------------------------------
// Subnets
// ---------------------------------------------------------------------

SubnetRecord NetworkService::CreateSubnet(const std::string& vpc_id, const std::string& cidr_block, const std::string& availability_zone) {
  return ObserveOperation("ec2.CreateSubnet", [&] {
    const auto vpc = Require<VpcRecord>(*ctx_.state, kVpcPrefix + vpc_id, "The vpc ID '" + vpc_id + "' does not exist");

    const auto range = RequireCidr(cidr_block);
    if (!Within(range, RequireCidr(vpc.cidr_block()))) {
      throw util::InvalidArgument("The CIDR '" + cidr_block + "' is invalid for vpc " + vpc_id + ".");
    }
    for (const auto& other : ListRecords<SubnetRecord>(*ctx_.state, kSubnetPrefix)) {
      if (other.vpc_id() != vpc_id) continue;
      const auto other_range = ParseCidr(other.cidr_block());
      if (other_range && Overlaps(range, *other_range)) {
        throw util::InvalidArgument("The CIDR '" + cidr_block + "' conflicts with another subnet");
      }
    }

    SubnetRecord subnet;
    subnet.set_subnet_id(util::GenerateNetworkId("subnet"));
    subnet.set_vpc_id(vpc_id);
    subnet.set_cidr_block(cidr_block);
    subnet.set_availability_zone(availability_zone);
    subnet.set_default_for_az(false);

    const auto key = kSubnetPrefix + subnet.subnet_id();
    ThrowIfStateError(state::PutRecord(*ctx_.state, key, subnet), "store subnet");

    const auto id = Ec2Id("subnet", subnet.subnet_id());
    graph_.Register(id, {{"cidrBlock", cidr_block}, {"vpcId", vpc_id}}, [&] { UndoDelete(*ctx_.state, key); });
    graph_.Relate(Ec2Id("vpc", vpc_id), id, RelationshipKind::kContains, [&] {
      UndoRegister(graph_.Tracker(), id);
      UndoDelete(*ctx_.state, key);
    });
    return subnet;
  });
}

SubnetRecord NetworkService::DescribeSubnet(const std::string& subnet_id) const {
  return Require<SubnetRecord>(*ctx_.state, kSubnetPrefix + subnet_id, "The subnet ID '" + subnet_id + "' does not exist");
}

void NetworkService::DeleteSubnet(const std::string& subnet_id) {
  ObserveOperation("ec2.DeleteSubnet", [&] {
    const auto subnet = DescribeSubnet(subnet_id);
    const auto id     = Ec2Id("subnet", subnet_id);

    if (IsDefault(id, subnet.default_for_az())) {
      throw util::OperationNotPermitted("Cannot delete the default subnet " + subnet_id);
    }

    // Running instances reference the subnet.
    graph_.Unregister(id);
    ThrowIfStateError(ctx_.state->Delete(kSubnetPrefix + subnet_id), "delete subnet");
  });
}

// ---------------------------------------------------------------------
// Security groups
// ---------------------------------------------------------------------

SecurityGroupRecord NetworkService::CreateSecurityGroup(const std::string& vpc_id, const std::string& group_name, const std::string& description) {
  return ObserveOperation("ec2.CreateSecurityGroup", [&] {
    if (group_name.empty()) {
      throw util::InvalidArgument("GroupName is required");
    }
    if (group_name == "default") {
      throw util::InvalidArgument("group name 'default' is reserved");
    }
    Require<VpcRecord>(*ctx_.state, kVpcPrefix + vpc_id, "The vpc ID '" + vpc_id + "' does not exist");

    for (const auto& other : ListRecords<SecurityGroupRecord>(*ctx_.state, kSecurityGroupPrefix)) {
      if (other.vpc_id() == vpc_id && other.group_name() == group_name) {
        throw util::AlreadyExists("The security group '" + group_name + "' already exists for VPC '" + vpc_id + "'");
      }
    }

    SecurityGroupRecord sg;
    sg.set_group_id(util::GenerateNetworkId("sg"));
    sg.set_group_name(group_name);
    sg.set_description(description);
    sg.set_vpc_id(vpc_id);
    sg.set_is_default(false);

    const auto key = kSecurityGroupPrefix + sg.group_id();
    ThrowIfStateError(state::PutRecord(*ctx_.state, key, sg), "store security group");

    const auto id = Ec2Id("security-group", sg.group_id());
    graph_.Register(id, {{"name", group_name}, {"vpcId", vpc_id}}, [&] { UndoDelete(*ctx_.state, key); });
    graph_.Relate(Ec2Id("vpc", vpc_id), id, RelationshipKind::kContains, [&] {
      UndoRegister(graph_.Tracker(), id);
      UndoDelete(*ctx_.state, key);
    });
    return sg;
  });
}

SecurityGroupRecord NetworkService::DescribeSecurityGroup(const std::string& group_id) const {
  return Require<SecurityGroupRecord>(*ctx_.state, kSecurityGroupPrefix + group_id, "The security group '" + group_id + "' does not exist");
}

void NetworkService::DeleteSecurityGroup(const std::string& group_id) {
  ObserveOperation("ec2.DeleteSecurityGroup", [&] {
    const auto sg = DescribeSecurityGroup(group_id);
    const auto id = Ec2Id("security-group", group_id);

    if (IsDefault(id, sg.is_default())) {
      throw util::OperationNotPermitted("Cannot delete the default security group " + group_id);
    }

    graph_.Unregister(id);
    ThrowIfStateError(ctx_.state->Delete(kSecurityGroupPrefix + group_id), "delete security group");
  });
}

// ---------------------------------------------------------------------
// Route tables
// ---------------------------------------------------------------------

RouteTableRecord NetworkService::CreateRouteTable(const std::string& vpc_id) {
  return ObserveOperation("ec2.CreateRouteTable", [&] {
    Require<VpcRecord>(*ctx_.state, kVpcPrefix + vpc_id, "The vpc ID '" + vpc_id + "' does not exist");

    RouteTableRecord rtb;
    rtb.set_route_table_id(util::GenerateNetworkId("rtb"));
    rtb.set_vpc_id(vpc_id);
    rtb.set_main(false);

    const auto key = kRouteTablePrefix + rtb.route_table_id();
    ThrowIfStateError(state::PutRecord(*ctx_.state, key, rtb), "store route table");

    const auto id = Ec2Id("route-table", rtb.route_table_id());
    graph_.Register(id, {{"vpcId", vpc_id}}, [&] { UndoDelete(*ctx_.state, key); });
    graph_.Relate(Ec2Id("vpc", vpc_id), id, RelationshipKind::kContains, [&] {
      UndoRegister(graph_.Tracker(), id);
      UndoDelete(*ctx_.state, key);
    });
    return rtb;
  });
}

void NetworkService::DeleteRouteTable(const std::string& route_table_id) {
  ObserveOperation("ec2.DeleteRouteTable", [&] {
    const auto key = kRouteTablePrefix + route_table_id;
    const auto rtb = Require<RouteTableRecord>(*ctx_.state, key, "The routeTable ID '" + route_table_id + "' does not exist");

    if (rtb.main()) {
      throw util::OperationNotPermitted("The main route table " + route_table_id + " cannot be deleted");
    }

    graph_.Unregister(Ec2Id("route-table", route_table_id));
    ThrowIfStateError(ctx_.state->Delete(key), "delete route table");
  });
}

// ---------------------------------------------------------------------
// Instances
// ---------------------------------------------------------------------

InstanceRecord NetworkService::RunInstance(const std::string& subnet_id, const std::vector<std::string>& security_group_ids) {
  return ObserveOperation("ec2.RunInstance", [&] {
    const auto subnet = DescribeSubnet(subnet_id);

    std::vector<std::string> groups = security_group_ids;
    if (groups.empty()) {
      for (const auto& sg : ListRecords<SecurityGroupRecord>(*ctx_.state, kSecurityGroupPrefix)) {
        if (sg.vpc_id() == subnet.vpc_id() && sg.is_default()) {
          groups.push_back(sg.group_id());
          break;
        }
      }
    }
    for (const auto& group_id : groups) {
      const auto sg = DescribeSecurityGroup(group_id);
      if (sg.vpc_id() != subnet.vpc_id()) {
        throw util::InvalidArgument("Security group " + group_id + " and subnet " + subnet_id + " belong to different networks.");
      }
    }

    InstanceRecord instance;
    instance.set_instance_id(util::GenerateNetworkId("i"));
    instance.set_subnet_id(subnet_id);
    for (const auto& group_id : groups) {
      instance.add_security_group_ids(group_id);
    }
    instance.set_state("running");
    instance.set_launched_at_ms(util::NowUnixMillis());

    const auto key = kInstancePrefix + instance.instance_id();
    ThrowIfStateError(state::PutRecord(*ctx_.state, key, instance), "store instance");

    // Unregistering the instance drops any edges added before a failure.
    const auto id       = Ec2Id("instance", instance.instance_id());
    const auto rollback = [&] {
      UndoRegister(graph_.Tracker(), id);
      UndoDelete(*ctx_.state, key);
    };

    graph_.Register(id, {{"subnetId", subnet_id}, {"vpcId", subnet.vpc_id()}}, [&] { UndoDelete(*ctx_.state, key); });
    graph_.Relate(id, Ec2Id("subnet", subnet_id), RelationshipKind::kReferences, rollback);
    for (const auto& group_id : groups) {
      graph_.Relate(id, Ec2Id("security-group", group_id), RelationshipKind::kReferences, rollback);
    }
    return instance;
  });
}

InstanceRecord NetworkService::DescribeInstance(const std::string& instance_id) const {
  return Require<InstanceRecord>(*ctx_.state, kInstancePrefix + instance_id, "The instance ID '" + instance_id + "' does not exist");
}

void NetworkService::TerminateInstance(const std::string& instance_id) {
  ObserveOperation("ec2.TerminateInstance", [&] {
    const auto key      = kInstancePrefix + instance_id;
    const auto instance = DescribeInstance(instance_id);
    if (instance.state() == "terminated") {
      return;
    }

    // The terminated record stays describable; only its references go.
    graph_.Unregister(Ec2Id("instance", instance_id));

    const auto result = state::UpdateRecord<InstanceRecord>(*ctx_.state, key, [](InstanceRecord& record) {
      record.set_state("terminated");
      return state::Result::Ok();
    });
    ThrowIfStateError(result, "terminate instance");
    CLOUDSIM_LOG_INFO("instance terminated", {StringField("instance_id", instance_id), StringField("subnet_id", instance.subnet_id())});
  });
}

} // namespace cloudsim::service
