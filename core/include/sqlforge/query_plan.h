#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "sqlforge/value.h"

namespace sqlforge {

struct QueryPlan;
class Dialect;
using QueryPlanPtr = std::shared_ptr<const QueryPlan>;

/// Binding groups in the order they are flattened for a select statement.
/// MUST stay aligned with the clause order produced by the select compiler.
enum class BindingGroup {
  Select,
  From,
  Join,
  Where,
  GroupBy,
  Having,
  Order,
  Union,
  UnionOrder,
};

constexpr size_t kBindingGroupCount = 9;

const char* binding_group_name(BindingGroup group);

/// Parameter values collected per clause kind by the query builder.
struct Bindings {
  std::array<std::vector<Value>, kBindingGroupCount> groups;

  std::vector<Value>& operator[](BindingGroup group) { return groups[static_cast<size_t>(group)]; }
  const std::vector<Value>& operator[](BindingGroup group) const {
    return groups[static_cast<size_t>(group)];
  }

  std::vector<Value> flatten() const;
  std::vector<Value> flatten_except(std::initializer_list<BindingGroup> excluded) const;
};

namespace where {

struct Raw {
  Identifier sql;
};

struct Basic {
  Identifier column;
  std::string op = "=";
  Value value;
};

struct Bitwise {
  Identifier column;
  std::string op;
  Value value;
};

struct Like {
  Identifier column;
  Value value;
  bool negate = false;
  bool case_sensitive = false;
};

struct In {
  Identifier column;
  std::vector<Value> values;
};

struct NotIn {
  Identifier column;
  std::vector<Value> values;
};

/// Values are inlined unparameterized; only integers are accepted.
struct InRaw {
  Identifier column;
  std::vector<Value> values;
};

struct NotInRaw {
  Identifier column;
  std::vector<Value> values;
};

struct Null {
  Identifier column;
};

struct NotNull {
  Identifier column;
};

struct Between {
  Identifier column;
  std::vector<Value> values;
  bool negate = false;
};

struct BetweenColumns {
  Identifier column;
  std::vector<Identifier> bounds;
  bool negate = false;
};

struct ValueBetween {
  Value value;
  std::vector<Identifier> columns;
  bool negate = false;
};

struct DatePart {
  enum class Part { Date, Time, Day, Month, Year } part = Part::Date;
  Identifier column;
  std::string op = "=";
  Value value;
};

struct ColumnCompare {
  Identifier first;
  std::string op = "=";
  Identifier second;
};

struct Nested {
  QueryPlanPtr query;
};

struct Sub {
  Identifier column;
  std::string op = "=";
  QueryPlanPtr query;
};

struct Exists {
  QueryPlanPtr query;
  bool negate = false;
};

struct RowValues {
  std::vector<Identifier> columns;
  std::string op = "=";
  std::vector<Value> values;
};

struct JsonBoolean {
  std::string column;
  std::string op = "=";
  Value value;
};

struct JsonContains {
  std::string column;
  Value value;
  bool negate = false;
};

struct JsonOverlaps {
  std::string column;
  Value value;
  bool negate = false;
};

struct JsonContainsKey {
  std::string column;
  bool negate = false;
};

struct JsonLength {
  std::string column;
  std::string op = "=";
  Value value;
};

struct FullText {
  std::vector<std::string> columns;
  Value value;
  std::map<std::string, std::string> options;
};

struct ExpressionPredicate {
  ExpressionPtr expression;
};

}  // namespace where

using PredicateBody = std::variant<where::Raw,
                                   where::Basic,
                                   where::Bitwise,
                                   where::Like,
                                   where::In,
                                   where::NotIn,
                                   where::InRaw,
                                   where::NotInRaw,
                                   where::Null,
                                   where::NotNull,
                                   where::Between,
                                   where::BetweenColumns,
                                   where::ValueBetween,
                                   where::DatePart,
                                   where::ColumnCompare,
                                   where::Nested,
                                   where::Sub,
                                   where::Exists,
                                   where::RowValues,
                                   where::JsonBoolean,
                                   where::JsonContains,
                                   where::JsonOverlaps,
                                   where::JsonContainsKey,
                                   where::JsonLength,
                                   where::FullText,
                                   where::ExpressionPredicate>;

/// One filter condition. The boolean is only rendered for non-first predicates.
struct Predicate {
  std::string boolean = "and";
  PredicateBody body;
};

namespace having {

struct Raw {
  std::string sql;
};

struct Basic {
  Identifier column;
  std::string op = "=";
  Value value;
};

struct Between {
  Identifier column;
  std::vector<Value> values;
  bool negate = false;
};

struct Null {
  Identifier column;
};

struct NotNull {
  Identifier column;
};

struct Bit {
  Identifier column;
  std::string op;
  Value value;
};

struct ExpressionPredicate {
  ExpressionPtr expression;
};

struct Nested {
  QueryPlanPtr query;
};

}  // namespace having

using HavingBody = std::variant<having::Raw,
                                having::Basic,
                                having::Between,
                                having::Null,
                                having::NotNull,
                                having::Bit,
                                having::ExpressionPredicate,
                                having::Nested>;

struct HavingPredicate {
  std::string boolean = "and";
  HavingBody body;
};

/// A join target with its "on" predicates. A non-empty `joins` list turns the
/// target into a parenthesized compound join.
struct JoinSpec {
  std::string type = "inner";
  Identifier table;
  std::vector<Predicate> wheres;
  std::vector<JoinSpec> joins;
  bool lateral = false;
};

/// Column + direction, or a precompiled SQL fragment when `sql` is set.
struct OrderSpec {
  Identifier column;
  std::string direction = "asc";
  std::optional<std::string> sql;
};

struct Aggregate {
  std::string function;
  std::vector<Identifier> columns;
};

struct GroupLimit {
  int64_t value = 0;
  std::string column;
};

struct UnionSpec {
  QueryPlanPtr query;
  bool all = false;
};

struct IndexHint {
  std::string type;
  std::string index;
};

/// Immutable snapshot of a read query handed over by the query builder.
/// MUST be treated as read-only by the compiler; rewrites happen on local copies.
struct QueryPlan {
  std::optional<Aggregate> aggregate;
  std::optional<std::vector<Identifier>> columns;
  std::variant<bool, std::vector<Identifier>> distinct = false;
  std::optional<Identifier> from;
  std::optional<IndexHint> index_hint;
  std::vector<JoinSpec> joins;
  std::vector<Predicate> wheres;
  std::vector<Identifier> groups;
  std::vector<HavingPredicate> havings;
  std::vector<OrderSpec> orders;
  std::optional<int64_t> limit;
  std::optional<int64_t> offset;
  std::optional<GroupLimit> group_limit;
  std::vector<UnionSpec> unions;
  std::vector<OrderSpec> union_orders;
  std::optional<int64_t> union_limit;
  std::optional<int64_t> union_offset;
  std::optional<std::variant<bool, std::string>> lock;
  Bindings bindings;
};

/// Recomputes binding groups from the plan's joins, predicates, havings and
/// unions, in the order a query builder accumulates them. Expression values
/// are skipped; raw integer lists contribute nothing. JSON contains and
/// overlaps values are encoded through the dialect's binding hook.
Bindings derive_bindings(const QueryPlan& plan, const Dialect& dialect);
/// Same as above with the default dialect's encoding.
Bindings derive_bindings(const QueryPlan& plan);

}  // namespace sqlforge
