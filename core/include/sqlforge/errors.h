#pragma once

#include <stdexcept>
#include <string>

namespace sqlforge {

/// Base class for every failure raised while compiling a query plan.
/// MUST carry a message that names the offending feature or plan element.
class SqlforgeError : public std::runtime_error {
 public:
  explicit SqlforgeError(const std::string& message) : std::runtime_error(message) {}
};

/// Raised when the active dialect does not provide a capability hook
/// (lateral joins, JSON predicates, full-text, upserts, ...).
/// MUST be fatal for the current compilation call.
class UnsupportedOperation : public SqlforgeError {
 public:
  explicit UnsupportedOperation(const std::string& message) : SqlforgeError(message) {}
};

/// Raised when the plan handed over by the query builder is structurally invalid.
/// Indicates a caller defect, never a data problem.
class MalformedPlan : public SqlforgeError {
 public:
  explicit MalformedPlan(const std::string& message) : SqlforgeError(message) {}
};

/// Raised when a JSON plan document cannot be mapped onto a QueryPlan.
class PlanFormatError : public SqlforgeError {
 public:
  explicit PlanFormatError(const std::string& message) : SqlforgeError(message) {}
};

}  // namespace sqlforge
