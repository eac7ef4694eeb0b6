#include "internal/graph/relationship_schema.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/graph/provider_schema.hpp"
#include "internal/graph/relationship_graph.hpp"
#include "internal/util/errors.hpp"

namespace {

using cloudsim::graph::BuildProviderSchema;
using cloudsim::graph::Cardinality;
using cloudsim::graph::GraphOptions;
using cloudsim::graph::RelationshipGraph;
using cloudsim::graph::RelationshipKind;
using cloudsim::graph::RelationshipSchema;
using cloudsim::graph::ResourceID;

RelationshipGraph ProviderGraph() {
  return RelationshipGraph(GraphOptions{true, std::make_shared<const RelationshipSchema>(BuildProviderSchema())});
}

void TestProviderSchemaDeclaresCoreRelationships() {
  const auto schema = BuildProviderSchema();

  assert(schema.Validate({"ec2", "vpc", "v"}, {"ec2", "subnet", "s"}, RelationshipKind::kContains));
  assert(schema.Validate({"iam", "policy", "p"}, {"iam", "role", "r"}, RelationshipKind::kAssociatedWith));
  assert(schema.Validate({"iam", "user", "u"}, {"iam", "access-key", "k"}, RelationshipKind::kContains));
  assert(schema.Validate({"ec2", "instance", "i"}, {"ec2", "security-group", "sg"}, RelationshipKind::kReferences));

  // Declared direction only.
  assert(!schema.Validate({"ec2", "subnet", "s"}, {"ec2", "vpc", "v"}, RelationshipKind::kContains));

  const auto* entry = schema.Lookup({"ec2", "internet-gateway", "igw"}, {"ec2", "vpc", "v"});
  assert(entry != nullptr);
  assert(entry->kind == RelationshipKind::kAttachedTo);
  assert(entry->cardinality == Cardinality::kOneToOne);
}

void TestKindMismatchIsReported() {
  const auto schema = BuildProviderSchema();

  bool threw = false;
  try {
    (void)schema.Check({"ec2", "vpc", "v"}, {"ec2", "subnet", "s"}, RelationshipKind::kReferences);
  } catch (const cloudsim::util::SchemaViolation& e) {
    threw = true;
    assert(e.Relationship() == "ec2:vpc -> ec2:subnet");
    assert(std::string(e.what()).find("kind mismatch") != std::string::npos);
  }
  assert(threw);
}

void TestUndeclaredPairIsReported() {
  const auto schema = BuildProviderSchema();

  bool threw = false;
  try {
    (void)schema.Check({"s3", "bucket", "b"}, {"ec2", "vpc", "v"}, RelationshipKind::kContains);
  } catch (const cloudsim::util::SchemaViolation& e) {
    threw = true;
    assert(std::string(e.what()) == "relationship not defined in schema: s3:bucket -> ec2:vpc");
  }
  assert(threw);
}

void TestSubnetCannotBelongToTwoVpcs() {
  auto graph = ProviderGraph();
  graph.AddNode({"ec2", "vpc", "vpc-1"}, {});
  graph.AddNode({"ec2", "vpc", "vpc-2"}, {});
  graph.AddNode({"ec2", "subnet", "subnet-1"}, {});
  graph.AddNode({"ec2", "subnet", "subnet-2"}, {});

  graph.AddEdge({"ec2", "vpc", "vpc-1"}, {"ec2", "subnet", "subnet-1"}, RelationshipKind::kContains);
  graph.AddEdge({"ec2", "vpc", "vpc-1"}, {"ec2", "subnet", "subnet-2"}, RelationshipKind::kContains);

  bool threw = false;
  try {
    graph.AddEdge({"ec2", "vpc", "vpc-2"}, {"ec2", "subnet", "subnet-1"}, RelationshipKind::kContains);
  } catch (const cloudsim::util::CardinalityViolation& e) {
    threw = true;
    assert(e.Relationship() == "ec2:vpc -> ec2:subnet");
  }
  assert(threw && "one-to-many must limit the subnet to a single vpc");
  assert(graph.EdgeCount() == 2);
}

void TestInstanceLaunchesIntoOneSubnet() {
  auto graph = ProviderGraph();
  const ResourceID instance{"ec2", "instance", "i-1"};
  graph.AddNode(instance, {});
  graph.AddNode({"ec2", "subnet", "subnet-1"}, {});
  graph.AddNode({"ec2", "subnet", "subnet-2"}, {});
  graph.AddNode({"ec2", "security-group", "sg-1"}, {});
  graph.AddNode({"ec2", "security-group", "sg-2"}, {});

  graph.AddEdge(instance, {"ec2", "subnet", "subnet-1"}, RelationshipKind::kReferences);
  graph.AddEdge(instance, {"ec2", "security-group", "sg-1"}, RelationshipKind::kReferences);
  graph.AddEdge(instance, {"ec2", "security-group", "sg-2"}, RelationshipKind::kReferences);

  bool threw = false;
  try {
    graph.AddEdge(instance, {"ec2", "subnet", "subnet-2"}, RelationshipKind::kReferences);
  } catch (const cloudsim::util::CardinalityViolation&) {
    threw = true;
  }
  assert(threw && "many-to-one must limit the instance to a single subnet");
}

void TestInstanceProfileHoldsOneRole() {
  auto graph = ProviderGraph();
  graph.AddNode({"iam", "instance-profile", "web"}, {});
  graph.AddNode({"iam", "role", "a"}, {});
  graph.AddNode({"iam", "role", "b"}, {});

  graph.AddEdge({"iam", "instance-profile", "web"}, {"iam", "role", "a"}, RelationshipKind::kContains);
  // Re-adding the same edge is not a second link.
  graph.AddEdge({"iam", "instance-profile", "web"}, {"iam", "role", "a"}, RelationshipKind::kContains);

  bool threw = false;
  try {
    graph.AddEdge({"iam", "instance-profile", "web"}, {"iam", "role", "b"}, RelationshipKind::kContains);
  } catch (const cloudsim::util::CardinalityViolation&) {
    threw = true;
  }
  assert(threw);

  // The same role may be mounted in another profile.
  graph.AddNode({"iam", "instance-profile", "batch"}, {});
  graph.AddEdge({"iam", "instance-profile", "batch"}, {"iam", "role", "a"}, RelationshipKind::kContains);
  assert(graph.EdgeCount() == 2);
}

void TestEntriesAreListedByEndpoint() {
  const auto schema = BuildProviderSchema();

  const auto from_vpc = schema.EntriesFrom("ec2", "vpc");
  assert(from_vpc.size() == 4);
  assert(from_vpc.front() == "ec2:vpc -> ec2:network-acl");

  const auto to_sg = schema.EntriesTo("ec2", "security-group");
  assert(to_sg.size() == 5);
}

} // namespace

int main() {
  TestProviderSchemaDeclaresCoreRelationships();
  TestKindMismatchIsReported();
  TestUndeclaredPairIsReported();
  TestSubnetCannotBelongToTwoVpcs();
  TestInstanceLaunchesIntoOneSubnet();
  TestInstanceProfileHoldsOneRole();
  TestEntriesAreListedByEndpoint();

  std::cout << "cloudsim_unit_relationship_schema: pass\n";
  return 0;
}
