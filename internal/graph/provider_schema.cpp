#include "internal/graph/provider_schema.hpp"

namespace cloudsim::graph {

RelationshipSchema BuildProviderSchema() {
  RelationshipSchema schema;

  // ------------------------------------------------------------
  // EC2
  // ------------------------------------------------------------

  schema.Add("ec2", "vpc", "ec2", "subnet", {RelationshipKind::kContains, Cardinality::kOneToMany, "VPCs contain subnets"});
  schema.Add("ec2", "vpc", "ec2", "security-group",
             {RelationshipKind::kContains, Cardinality::kOneToMany, "VPCs contain security groups"});
  schema.Add("ec2", "vpc", "ec2", "route-table", {RelationshipKind::kContains, Cardinality::kOneToMany, "VPCs contain route tables"});
  schema.Add("ec2", "vpc", "ec2", "network-acl", {RelationshipKind::kContains, Cardinality::kOneToMany, "VPCs contain network ACLs"});

  schema.Add("ec2", "subnet", "ec2", "nat-gateway",
             {RelationshipKind::kContains, Cardinality::kOneToMany, "NAT gateways are created in subnets"});
  schema.Add("ec2", "subnet", "ec2", "network-interface",
             {RelationshipKind::kContains, Cardinality::kOneToMany, "Network interfaces are created in subnets"});

  schema.Add("ec2", "internet-gateway", "ec2", "vpc",
             {RelationshipKind::kAttachedTo, Cardinality::kOneToOne, "Internet gateways can be attached to one VPC"});

  schema.Add("ec2", "instance", "ec2", "subnet", {RelationshipKind::kReferences, Cardinality::kManyToOne, "Instances are launched in subnets"});
  schema.Add("ec2", "instance", "ec2", "security-group",
             {RelationshipKind::kReferences, Cardinality::kManyToMany, "Instances reference security groups"});
  schema.Add("ec2", "instance", "ec2", "key-pair", {RelationshipKind::kReferences, Cardinality::kManyToOne, "Instances use one key pair"});
  schema.Add("ec2", "instance", "iam", "instance-profile",
             {RelationshipKind::kReferences, Cardinality::kManyToOne, "Instances run with one instance profile"});
  schema.Add("ec2", "network-interface", "ec2", "security-group",
             {RelationshipKind::kReferences, Cardinality::kManyToMany, "Network interfaces reference security groups"});

  // ------------------------------------------------------------
  // IAM
  // ------------------------------------------------------------

  schema.Add("iam", "policy", "iam", "role", {RelationshipKind::kAssociatedWith, Cardinality::kManyToMany, "Managed policies attach to roles"});
  schema.Add("iam", "policy", "iam", "group",
             {RelationshipKind::kAssociatedWith, Cardinality::kManyToMany, "Managed policies attach to groups"});
  schema.Add("iam", "policy", "iam", "user", {RelationshipKind::kAssociatedWith, Cardinality::kManyToMany, "Managed policies attach to users"});
  schema.Add("iam", "user", "iam", "group", {RelationshipKind::kAssociatedWith, Cardinality::kManyToMany, "Users are members of groups"});

  // A profile holds at most one role; a role may sit in several profiles.
  schema.Add("iam", "instance-profile", "iam", "role",
             {RelationshipKind::kContains, Cardinality::kManyToOne, "Instance profiles contain a role"});
  schema.Add("iam", "user", "iam", "access-key", {RelationshipKind::kContains, Cardinality::kOneToMany, "Users own their access keys"});

  // ------------------------------------------------------------
  // RDS
  // ------------------------------------------------------------

  schema.Add("rds", "db-instance", "rds", "db-subnet-group",
             {RelationshipKind::kReferences, Cardinality::kManyToOne, "DB instances are placed in a DB subnet group"});
  schema.Add("rds", "db-instance", "ec2", "security-group",
             {RelationshipKind::kReferences, Cardinality::kManyToMany, "DB instances reference VPC security groups"});
  schema.Add("rds", "db-subnet-group", "ec2", "subnet",
             {RelationshipKind::kReferences, Cardinality::kManyToMany, "DB subnet groups span subnets"});

  // ------------------------------------------------------------
  // Lambda
  // ------------------------------------------------------------

  schema.Add("lambda", "function", "ec2", "security-group",
             {RelationshipKind::kReferences, Cardinality::kManyToMany, "VPC functions reference security groups"});
  schema.Add("lambda", "function", "ec2", "subnet", {RelationshipKind::kReferences, Cardinality::kManyToMany, "VPC functions run in subnets"});

  return schema;
}

} // namespace cloudsim::graph
