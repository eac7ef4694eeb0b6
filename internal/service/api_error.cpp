#include "api_error.hpp"

#include "internal/util/errors.hpp"

namespace cloudsim::service {

ApiError ToApiError(const std::exception& e, ErrorDialect dialect) {
  using namespace cloudsim::util;

  const bool network = dialect == ErrorDialect::kNetwork;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {network ? 400 : 404, network ? "InvalidResourceID.NotFound" : "NoSuchEntity", e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {network ? 400 : 409, network ? "InvalidResource.Duplicate" : "EntityAlreadyExists", e.what()};
  }
  if (dynamic_cast<const DependencyViolation*>(&e)) {
    return {network ? 400 : 409, network ? "DependencyViolation" : "DeleteConflict", e.what()};
  }
  if (dynamic_cast<const OperationNotPermitted*>(&e)) {
    return {400, "OperationNotPermitted", e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {400, network ? "InvalidParameterValue" : "ValidationError", e.what()};
  }
  if (dynamic_cast<const LimitExceeded*>(&e)) {
    return {409, "LimitExceeded", e.what()};
  }

  if (dynamic_cast<const BookkeepingFailure*>(&e)) {
    return {500, "InternalFailure", e.what()};
  }

  return {500, "InternalFailure", e.what()};
}

} // namespace cloudsim::service
