#pragma once

#include "internal/graph/resource_id.hpp"
#include "internal/graph/resource_tracker.hpp"

namespace cloudsim::graph {

/*
  Provider-seeded network resources. Every account starts with a default VPC
  holding a subnet, network ACL, route table and security group; all of them
  carry default=true and cannot be deleted through the API.
*/
namespace defaults {

inline constexpr const char* kVpcId           = "vpc-default";
inline constexpr const char* kVpcCidr         = "172.31.0.0/16";
inline constexpr const char* kSubnetId        = "subnet-default";
inline constexpr const char* kSubnetCidr      = "172.31.0.0/20";
inline constexpr const char* kNetworkAclId    = "acl-default";
inline constexpr const char* kRouteTableId    = "rtb-default";
inline constexpr const char* kSecurityGroupId = "sg-default";

ResourceID Vpc();
ResourceID Subnet();
ResourceID NetworkAcl();
ResourceID RouteTable();
ResourceID SecurityGroup();

} // namespace defaults

// Registers the default VPC, its four members, and vpc -[contains]-> member edges.
void SeedDefaultNetworkTopology(ResourceTracker& tracker);

} // namespace cloudsim::graph
