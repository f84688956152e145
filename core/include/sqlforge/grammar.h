#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sqlforge/dialect.h"
#include "sqlforge/query_plan.h"
#include "sqlforge/value.h"

namespace sqlforge {

/// Grammar configuration fixed at construction.
struct GrammarOptions {
  std::string table_prefix;
};

/// Finished statement: SQL text plus bindings in placeholder order.
struct CompiledQuery {
  std::string sql;
  std::vector<Value> bindings;
};

/// Keyword that introduces a predicate list.
enum class ClauseContext { Where, On };

/// Compiles query plans into dialect SQL and positional bindings.
/// MUST NOT mutate caller plans; every rewrite happens on a local copy.
/// Safe to share across threads once constructed.
class Grammar {
 public:
  explicit Grammar(std::shared_ptr<const Dialect> dialect = nullptr, GrammarOptions options = {});

  const Dialect& dialect() const { return *dialect_; }
  const GrammarOptions& options() const { return options_; }

  /// Wraps a column reference, honoring `x as y` aliases, `t.c` qualification
  /// and `col->path` JSON selectors.
  std::string wrap(const Identifier& value) const;
  /// Wraps a table reference and applies the configured table prefix.
  std::string wrap_table(const Identifier& table) const;
  /// Wraps one identifier segment; `*` is returned as-is.
  std::string wrap_value(const std::string& segment) const;
  std::string wrap_segments(const std::vector<std::string>& segments) const;
  std::vector<std::string> wrap_array(const std::vector<Identifier>& values) const;

  bool is_json_selector(const std::string& value) const;
  /// Splits `col->a->b[0]` into a wrapped field and ordered path segments.
  JsonSelector decompose_json_selector(const std::string& value) const;
  /// Renders a selector's path in the portable `'$."a"[0]'` form.
  std::string wrap_json_path(const JsonSelector& selector) const;
  std::string wrap_json_selector(const std::string& value) const;

  /// Returns `?` for literal values and the rendered text for expressions.
  std::string parameter(const Value& value) const;
  std::string parameterize(const std::vector<Value>& values) const;
  std::string parameterize(const Record& record) const;
  std::string columnize(const std::vector<Identifier>& columns) const;
  std::string quote_string(const std::string& value) const;
  std::string quote_string(const std::vector<std::string>& values) const;
  std::string get_value(const Expression& expression) const;

  /// Compiles a plan's filter predicates; empty string when there are none.
  std::string compile_wheres(const QueryPlan& plan) const;
  /// Compiles a join's predicates behind the `on` keyword.
  std::string compile_wheres(const JoinSpec& join) const;
  std::string compile_predicates(const std::vector<Predicate>& predicates, ClauseContext context) const;
  std::string compile_havings(const std::vector<HavingPredicate>& havings) const;
  std::string compile_joins(const std::vector<JoinSpec>& joins) const;
  std::string compile_orders(const std::vector<OrderSpec>& orders) const;

  CompiledQuery compile_select(const QueryPlan& plan) const;
  /// SQL text only; used for sub-selects, unions and exists.
  std::string compile_select_sql(const QueryPlan& plan) const;
  CompiledQuery compile_exists(const QueryPlan& plan) const;

  CompiledQuery compile_insert(const QueryPlan& plan, const std::vector<Record>& records) const;
  CompiledQuery compile_insert(const QueryPlan& plan, const Record& record) const;
  CompiledQuery compile_insert_or_ignore(const QueryPlan& plan, const std::vector<Record>& records) const;
  CompiledQuery compile_insert_get_id(const QueryPlan& plan,
                                      const std::vector<Record>& records,
                                      const std::optional<std::string>& sequence) const;
  CompiledQuery compile_insert_using(const QueryPlan& plan,
                                     const std::vector<std::string>& columns,
                                     const CompiledQuery& source) const;
  CompiledQuery compile_insert_or_ignore_using(const QueryPlan& plan,
                                               const std::vector<std::string>& columns,
                                               const CompiledQuery& source) const;
  CompiledQuery compile_upsert(const QueryPlan& plan,
                               const std::vector<Record>& records,
                               const std::vector<std::string>& unique_by,
                               const std::vector<UpsertUpdate>& update) const;
  CompiledQuery compile_update(const QueryPlan& plan, const Assignments& values) const;
  CompiledQuery compile_delete(const QueryPlan& plan) const;
  std::vector<CompiledQuery> compile_truncate(const QueryPlan& plan) const;

  /// Plain insert SQL shared by the insert variants and dialect hooks.
  std::string compile_insert_sql(const QueryPlan& plan, const std::vector<Record>& records) const;
  std::string compile_update_columns(const Assignments& values) const;

  /// Orders update bindings: join, assigned values, then every remaining group but select.
  std::vector<Value> prepare_bindings_for_update(const Bindings& bindings, const Assignments& values) const;
  /// Flattens every group except select.
  std::vector<Value> prepare_bindings_for_delete(const Bindings& bindings) const;
  std::string prepare_binding_for_json_contains(const Value& value) const;

  /// Replaces unescaped `?` placeholders outside string literals with escaped values.
  std::string substitute_bindings_into_raw_sql(const std::string& sql, const std::vector<Value>& bindings) const;
  std::string to_raw_sql(const QueryPlan& plan) const;
  std::string escape(const Value& value, bool binary = false) const;

  bool supports_savepoints() const { return dialect_->supports_savepoints(); }
  std::string compile_savepoint(const std::string& name) const { return dialect_->compile_savepoint(name); }
  std::string compile_savepoint_rollback(const std::string& name) const {
    return dialect_->compile_savepoint_rollback(name);
  }
  std::string compile_random(const std::string& seed = "") const { return dialect_->compile_random(seed); }
  std::optional<std::string> compile_thread_count() const { return dialect_->compile_thread_count(); }
  std::string compile_json_value_cast(const std::string& value) const {
    return dialect_->compile_json_value_cast(value);
  }
  std::string date_format() const { return dialect_->date_format(); }
  const std::vector<std::string>& operators() const { return dialect_->operators(); }
  const std::vector<std::string>& bitwise_operators() const { return dialect_->bitwise_operators(); }

 private:
  enum class Component {
    Aggregate,
    Columns,
    From,
    IndexHint,
    Joins,
    Wheres,
    Groups,
    Havings,
    Orders,
    Limit,
    Offset,
    Lock,
  };
  static constexpr size_t kComponentCount = 12;
  using Components = std::array<std::optional<std::string>, kComponentCount>;

  std::string select_sql(QueryPlan& plan) const;
  Components compile_components(const QueryPlan& plan) const;
  std::string compile_group_limit(QueryPlan& plan) const;
  std::string compile_union_aggregate(QueryPlan& plan) const;
  std::string compile_unions(const QueryPlan& plan) const;
  std::string compile_aggregate(const QueryPlan& plan, const Aggregate& aggregate) const;
  std::string compile_columns(const QueryPlan& plan, const std::vector<Identifier>& columns) const;
  std::string compile_row_number(const std::string& partition, const std::string& orders) const;

  std::string compile_predicate(const Predicate& predicate, ClauseContext context) const;
  std::string compile_having(const HavingPredicate& having) const;

  std::string wrap_name(const std::string& value) const;
  std::string wrap_aliased_value(const std::string& value) const;
  std::string wrap_aliased_table(const std::string& value) const;
  std::string wrap_table_name(const std::string& table) const;

  static std::string concatenate(const Components& components);

  std::shared_ptr<const Dialect> dialect_;
  GrammarOptions options_;
};

}  // namespace sqlforge
