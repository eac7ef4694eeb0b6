#pragma once

#include <string>
#include <vector>

#include "cloudsim/v1.hpp"
#include "resource_bookkeeping.hpp"
#include "service_context.hpp"

namespace cloudsim::service {

/*
  Emulated network/compute service.

  Graph edges maintained here:
    vpc      -Contains->   subnet | security-group | route-table | network-acl
    instance -References-> subnet
    instance -References-> security-group

  Every VPC gets a main route table and a "default" security group on
  creation. They are removed together with the VPC and never block it.
  The account's default VPC and its members cannot be deleted.
*/
class NetworkService {
 public:
  // Writes the default VPC records, and seeds the tracker when it does not
  // already hold them.
  explicit NetworkService(ServiceContext ctx);

  cloudsim::v1::VpcRecord              CreateVpc(const std::string& cidr_block);
  cloudsim::v1::VpcRecord              DescribeVpc(const std::string& vpc_id) const;
  std::vector<cloudsim::v1::VpcRecord> DescribeVpcs() const;
  void                                 DeleteVpc(const std::string& vpc_id);

  cloudsim::v1::SubnetRecord CreateSubnet(const std::string& vpc_id, const std::string& cidr_block, const std::string& availability_zone = "us-east-1a");
  cloudsim::v1::SubnetRecord DescribeSubnet(const std::string& subnet_id) const;
  void                       DeleteSubnet(const std::string& subnet_id);

  cloudsim::v1::SecurityGroupRecord CreateSecurityGroup(const std::string& vpc_id, const std::string& group_name, const std::string& description);
  cloudsim::v1::SecurityGroupRecord DescribeSecurityGroup(const std::string& group_id) const;
  void                              DeleteSecurityGroup(const std::string& group_id);

  cloudsim::v1::RouteTableRecord CreateRouteTable(const std::string& vpc_id);
  void                           DeleteRouteTable(const std::string& route_table_id);

  // An empty group list selects the VPC's default security group.
  cloudsim::v1::InstanceRecord RunInstance(const std::string& subnet_id, const std::vector<std::string>& security_group_ids = {});
  cloudsim::v1::InstanceRecord DescribeInstance(const std::string& instance_id) const;
  void                         TerminateInstance(const std::string& instance_id);

 private:
  void InitializeDefaults();

  bool IsDefault(const graph::ResourceID& id, bool record_flag) const;

  ServiceContext      ctx_;
  ResourceBookkeeping graph_;
};

} // namespace cloudsim::service
