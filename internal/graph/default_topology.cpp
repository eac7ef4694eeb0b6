#include "internal/graph/default_topology.hpp"

namespace cloudsim::graph {

namespace defaults {

ResourceID Vpc() {
  return {"ec2", "vpc", kVpcId};
}

ResourceID Subnet() {
  return {"ec2", "subnet", kSubnetId};
}

ResourceID NetworkAcl() {
  return {"ec2", "network-acl", kNetworkAclId};
}

ResourceID RouteTable() {
  return {"ec2", "route-table", kRouteTableId};
}

ResourceID SecurityGroup() {
  return {"ec2", "security-group", kSecurityGroupId};
}

} // namespace defaults

void SeedDefaultNetworkTopology(ResourceTracker& tracker) {
  tracker.RegisterResource(defaults::Vpc(), {{"cidrBlock", defaults::kVpcCidr}, {"default", "true"}});

  tracker.RegisterResource(defaults::Subnet(), {{"cidrBlock", defaults::kSubnetCidr}, {"vpcId", defaults::kVpcId}, {"default", "true"}});
  tracker.AddRelationship(defaults::Vpc(), defaults::Subnet(), RelationshipKind::kContains);

  tracker.RegisterResource(defaults::NetworkAcl(), {{"vpcId", defaults::kVpcId}, {"default", "true"}});
  tracker.AddRelationship(defaults::Vpc(), defaults::NetworkAcl(), RelationshipKind::kContains);

  tracker.RegisterResource(defaults::RouteTable(), {{"vpcId", defaults::kVpcId}, {"default", "true"}});
  tracker.AddRelationship(defaults::Vpc(), defaults::RouteTable(), RelationshipKind::kContains);

  tracker.RegisterResource(defaults::SecurityGroup(), {{"name", "default"}, {"vpcId", defaults::kVpcId}, {"default", "true"}});
  tracker.AddRelationship(defaults::Vpc(), defaults::SecurityGroup(), RelationshipKind::kContains);
}

} // namespace cloudsim::graph
