#include "internal/service/api_error.hpp"

#include <cassert>

#include <iostream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using cloudsim::graph::ResourceID;
using cloudsim::service::ErrorDialect;
using cloudsim::service::ToApiError;

void TestIdentityDialect() {
  const ResourceID role{"iam", "role", "app"};
  const ResourceID policy{"iam", "policy", "ReadOnly"};

  auto api = ToApiError(cloudsim::util::DependencyViolation(role, {policy}));
  assert(api.http_status == 409);
  assert(api.code == "DeleteConflict");
  assert(api.message == "cannot delete iam:role:app: 1 dependent(s) exist [iam:policy:ReadOnly]");

  api = ToApiError(cloudsim::util::NotFound("missing"));
  assert(api.http_status == 404 && api.code == "NoSuchEntity" && api.message == "missing");

  api = ToApiError(cloudsim::util::AlreadyExists("dup"));
  assert(api.http_status == 409 && api.code == "EntityAlreadyExists");

  api = ToApiError(cloudsim::util::InvalidArgument("bad"));
  assert(api.http_status == 400 && api.code == "ValidationError");

  api = ToApiError(cloudsim::util::LimitExceeded("quota"));
  assert(api.http_status == 409 && api.code == "LimitExceeded");
}

void TestNetworkDialect() {
  const ResourceID vpc{"ec2", "vpc", "vpc-1"};
  const ResourceID subnet{"ec2", "subnet", "subnet-1"};

  auto api = ToApiError(cloudsim::util::DependencyViolation(vpc, {subnet}), ErrorDialect::kNetwork);
  assert(api.http_status == 400);
  assert(api.code == "DependencyViolation");

  api = ToApiError(cloudsim::util::NotFound("missing"), ErrorDialect::kNetwork);
  assert(api.http_status == 400 && api.code == "InvalidResourceID.NotFound");

  api = ToApiError(cloudsim::util::OperationNotPermitted("default"), ErrorDialect::kNetwork);
  assert(api.http_status == 400 && api.code == "OperationNotPermitted");
}

void TestGraphFailuresAreInternal() {
  const ResourceID a{"test", "node", "a"};
  const ResourceID b{"test", "node", "b"};

  assert(ToApiError(cloudsim::util::WouldCreateCycle(a, b)).http_status == 500);
  assert(ToApiError(cloudsim::util::SchemaViolation("test:node -> test:node", "nope")).code == "InternalFailure");
  assert(ToApiError(cloudsim::util::BookkeepingFailure("rolled back")).code == "InternalFailure");
  assert(ToApiError(std::runtime_error("boom")).http_status == 500);
}

} // namespace

int main() {
  TestIdentityDialect();
  TestNetworkDialect();
  TestGraphFailuresAreInternal();

  std::cout << "cloudsim_unit_api_error: pass\n";
  return 0;
}
