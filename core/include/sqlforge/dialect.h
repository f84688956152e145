#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/query_plan.h"
#include "sqlforge/value.h"

namespace sqlforge {

class Grammar;

/// One step of a JSON path: an object key followed by zero or more array indices.
struct JsonPathSegment {
  std::string key;
  std::vector<std::string> indices;
};

/// A decomposed `column->a->b[0]` selector. `field` is already wrapped.
struct JsonSelector {
  std::string field;
  std::vector<JsonPathSegment> path;
};

/// Column update for an upsert: `value` empty means "take the inserted value".
struct UpsertUpdate {
  std::string column;
  std::optional<Value> value;
};

/// Capability object bundling every dialect-specific override point.
/// The base class is the default dialect: no identifier quoting, and every
/// capability hook it cannot express throws UnsupportedOperation.
/// MUST be immutable after construction so one dialect can serve many grammars.
class Dialect {
 public:
  Dialect() = default;
  Dialect(std::vector<std::string> operators, std::vector<std::string> bitwise_operators)
      : operators_(std::move(operators)), bitwise_operators_(std::move(bitwise_operators)) {}
  virtual ~Dialect() = default;

  virtual std::string name() const { return "default"; }

  /// Quotes a single identifier segment. `*` never reaches this hook.
  virtual std::string quote_identifier(const std::string& segment) const;

  /// Renders a decomposed JSON selector as dialect SQL.
  virtual std::string wrap_json_selector(const Grammar& grammar, const JsonSelector& selector) const;
  virtual std::string wrap_json_boolean_selector(const Grammar& grammar,
                                                 const JsonSelector& selector) const;
  virtual std::string wrap_json_boolean_value(const std::string& value) const;

  virtual std::string compile_json_contains(const Grammar& grammar,
                                            const std::string& column,
                                            const std::string& value) const;
  virtual std::string compile_json_overlaps(const Grammar& grammar,
                                            const std::string& column,
                                            const std::string& value) const;
  virtual std::string compile_json_contains_key(const Grammar& grammar,
                                                const std::string& column) const;
  virtual std::string compile_json_length(const Grammar& grammar,
                                          const std::string& column,
                                          const std::string& op,
                                          const std::string& value) const;
  /// Wraps a compiled value expression so the engine reads it as JSON. Identity by default.
  virtual std::string compile_json_value_cast(const std::string& value) const;
  /// Encodes a binding for JSON containment checks.
  virtual std::string prepare_binding_for_json_contains(const Value& value) const;

  virtual std::string compile_full_text(const Grammar& grammar, const where::FullText& where) const;
  virtual std::string compile_join_lateral(const Grammar& grammar,
                                           const JoinSpec& join,
                                           const std::string& expression) const;
  virtual std::string compile_case_sensitive_like(const Grammar& grammar, const where::Like& where) const;

  /// Validates and renders the inlined values of a raw in-list.
  /// MUST reject anything that is not an integer.
  virtual std::string compile_integer_list(const std::vector<Value>& values) const;

  virtual std::string compile_index_hint(const Grammar& grammar,
                                         const QueryPlan& plan,
                                         const IndexHint& hint) const;
  virtual std::string compile_lock(const Grammar& grammar,
                                   const QueryPlan& plan,
                                   const std::variant<bool, std::string>& lock) const;

  virtual std::string compile_upsert(const Grammar& grammar,
                                     const QueryPlan& plan,
                                     const std::vector<Record>& records,
                                     const std::vector<std::string>& unique_by,
                                     const std::vector<UpsertUpdate>& update) const;
  virtual std::string compile_insert_or_ignore(const Grammar& grammar,
                                               const QueryPlan& plan,
                                               const std::vector<Record>& records) const;
  virtual std::string compile_insert_or_ignore_using(const Grammar& grammar,
                                                     const QueryPlan& plan,
                                                     const std::vector<std::string>& columns,
                                                     const std::string& sql) const;
  virtual std::string compile_insert_get_id(const Grammar& grammar,
                                            const QueryPlan& plan,
                                            const std::vector<Record>& records,
                                            const std::optional<std::string>& sequence) const;
  /// Returns ordered statement text; engines may need several statements.
  virtual std::vector<std::string> compile_truncate(const Grammar& grammar, const QueryPlan& plan) const;

  virtual bool supports_savepoints() const { return true; }
  virtual std::string compile_savepoint(const std::string& name) const;
  virtual std::string compile_savepoint_rollback(const std::string& name) const;
  virtual std::string compile_random(const std::string& seed) const;
  virtual std::optional<std::string> compile_thread_count() const { return std::nullopt; }
  virtual std::string date_format() const { return "Y-m-d H:i:s"; }

  /// Renders a value as an inline SQL literal for raw-SQL substitution.
  virtual std::string escape(const Grammar& grammar, const Value& value, bool binary = false) const;
  virtual std::string escape_string(const std::string& value) const;
  virtual std::string escape_bool(bool value) const;
  virtual std::string escape_binary(const Blob& value) const;

  const std::vector<std::string>& operators() const { return operators_; }
  const std::vector<std::string>& bitwise_operators() const { return bitwise_operators_; }

 protected:
  std::vector<std::string> operators_;
  std::vector<std::string> bitwise_operators_;
};

/// Dialect with standard double-quoted identifiers and hex blob literals.
class AnsiDialect : public Dialect {
 public:
  AnsiDialect();

  std::string name() const override { return "ansi"; }
  std::string quote_identifier(const std::string& segment) const override;
  std::string escape_binary(const Blob& value) const override;
};

}  // namespace sqlforge
