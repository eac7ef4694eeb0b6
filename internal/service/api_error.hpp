#pragma once

#include <exception>
#include <string>

#include "internal/util/errors.hpp"

namespace cloudsim::service {

/*
  Provider-style error reported to the API caller.
*/
struct ApiError {
  int         http_status = 500;
  std::string code;
  std::string message;
};

enum class ErrorDialect {
  // IAM reports blocked deletes as DeleteConflict (409).
  kIdentity,
  // EC2 reports them as DependencyViolation (400).
  kNetwork,
};

/*
  Converts internal exceptions into provider error codes.
*/
ApiError ToApiError(const std::exception& e, ErrorDialect dialect = ErrorDialect::kIdentity);

} // namespace cloudsim::service
