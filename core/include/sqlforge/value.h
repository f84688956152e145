#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace sqlforge {

class Grammar;

/// SQL fragment that renders itself against the active grammar.
/// MUST be side-effect free; the same grammar always yields the same text.
class Expression {
 public:
  virtual ~Expression() = default;
  virtual std::string value(const Grammar& grammar) const = 0;
};

using ExpressionPtr = std::shared_ptr<const Expression>;

/// Literal SQL text inserted verbatim.
class RawExpression : public Expression {
 public:
  explicit RawExpression(std::string sql) : sql_(std::move(sql)) {}
  std::string value(const Grammar&) const override { return sql_; }

 private:
  std::string sql_;
};

/// Builds a raw expression so callers can mix literal SQL into columns and values.
ExpressionPtr raw(std::string sql);

struct Blob {
  std::vector<unsigned char> bytes;
};

/// A literal binding value or an expression marker.
/// Expression values are rendered inline and never travel as bindings.
class Value {
 public:
  using Storage = std::variant<std::nullptr_t, bool, int64_t, double, std::string, Blob, ExpressionPtr>;

  Value() : storage_(nullptr) {}
  Value(std::nullptr_t) : storage_(nullptr) {}
  Value(bool value) : storage_(value) {}
  Value(int value) : storage_(static_cast<int64_t>(value)) {}
  Value(long value) : storage_(static_cast<int64_t>(value)) {}
  Value(long long value) : storage_(static_cast<int64_t>(value)) {}
  Value(double value) : storage_(value) {}
  Value(const char* value) : storage_(std::string(value)) {}
  Value(std::string value) : storage_(std::move(value)) {}
  Value(Blob value) : storage_(std::move(value)) {}
  Value(ExpressionPtr value) : storage_(std::move(value)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(storage_); }
  bool is_expression() const { return std::holds_alternative<ExpressionPtr>(storage_); }
  bool is_integer() const { return std::holds_alternative<int64_t>(storage_); }
  bool is_string() const { return std::holds_alternative<std::string>(storage_); }

  const ExpressionPtr& expression() const { return std::get<ExpressionPtr>(storage_); }
  int64_t as_integer() const { return std::get<int64_t>(storage_); }
  const std::string& as_string() const { return std::get<std::string>(storage_); }
  const Storage& storage() const { return storage_; }

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  Storage storage_;
};

/// Column or table reference: a plain name or an expression rendered verbatim.
using Identifier = std::variant<std::string, ExpressionPtr>;

/// Ordered column/value pairs for a single inserted record.
using Record = std::vector<std::pair<std::string, Value>>;

/// Update value that is either known up front or resolved when bindings are prepared.
using AssignmentValue = std::variant<Value, std::function<Value()>>;
using Assignments = std::vector<std::pair<std::string, AssignmentValue>>;

/// Resolves a possibly deferred assignment value.
Value resolve_value(const AssignmentValue& value);

/// Drops expression values, which are rendered inline rather than bound.
std::vector<Value> clean_bindings(const std::vector<Value>& values);

/// Human-readable rendering used by diagnostics and the CLI binding listing.
std::string describe_value(const Value& value);

}  // namespace sqlforge
