#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/graph/resource_id.hpp"

namespace cloudsim::util {

/*
  Central error types.

  The graph core throws these; service handlers translate them into
  provider error codes (see internal/service/api_error.hpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WouldCreateCycle : public std::runtime_error {
 public:
  WouldCreateCycle(graph::ResourceID from, graph::ResourceID to)
      : std::runtime_error("adding edge " + from.String() + " -> " + to.String() + " would create a cycle"),
        from_(std::move(from)),
        to_(std::move(to)) {
  }

  const graph::ResourceID& From() const {
    return from_;
  }
  const graph::ResourceID& To() const {
    return to_;
  }

 private:
  graph::ResourceID from_;
  graph::ResourceID to_;
};

class SchemaViolation : public std::runtime_error {
 public:
  SchemaViolation(std::string relationship, const std::string& msg) : std::runtime_error(msg), relationship_(std::move(relationship)) {
  }

  // "service:type -> service:type"
  const std::string& Relationship() const {
    return relationship_;
  }

 private:
  std::string relationship_;
};

class CardinalityViolation : public SchemaViolation {
 public:
  using SchemaViolation::SchemaViolation;
};

/*
  Raised when a resource still has dependents. Blockers are kept in the
  order the dependency evaluator reported them.
*/
class DependencyViolation : public std::runtime_error {
 public:
  DependencyViolation(graph::ResourceID resource, std::vector<graph::ResourceID> blockers)
      : std::runtime_error(Describe(resource, blockers)), resource_(std::move(resource)), blockers_(std::move(blockers)) {
  }

  const graph::ResourceID& Resource() const {
    return resource_;
  }
  const std::vector<graph::ResourceID>& Blockers() const {
    return blockers_;
  }

 private:
  static std::string Describe(const graph::ResourceID& resource, const std::vector<graph::ResourceID>& blockers) {
    std::string joined;
    for (const auto& blocker : blockers) {
      if (!joined.empty()) joined += ", ";
      joined += blocker.String();
    }
    return "cannot delete " + resource.String() + ": " + std::to_string(blockers.size()) + " dependent(s) exist [" + joined + "]";
  }

  graph::ResourceID              resource_;
  std::vector<graph::ResourceID> blockers_;
};

// Caller-side policy refusal, e.g. deleting a provider default resource.
class OperationNotPermitted : public std::runtime_error {
 public:
  explicit OperationNotPermitted(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LimitExceeded : public std::runtime_error {
 public:
  explicit LimitExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A graph update failed in strict mode; the handler has rolled back its state.
class BookkeepingFailure : public std::runtime_error {
 public:
  explicit BookkeepingFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace cloudsim::util
