#include "sqlforge/grammar.h"

#include <glog/logging.h>

#include "sqlforge/errors.h"
#include "../util/string_util.h"

namespace sqlforge {

namespace {

constexpr const char* kGroupLimitTable = "sqlforge_table";
constexpr const char* kGroupLimitRow = "sqlforge_row";
constexpr const char* kUnionAggregateTable = "temp_table";

}  // namespace

CompiledQuery Grammar::compile_select(const QueryPlan& plan) const {
  QueryPlan working = plan;
  std::string sql = select_sql(working);
  return CompiledQuery{std::move(sql), working.bindings.flatten()};
}

std::string Grammar::compile_select_sql(const QueryPlan& plan) const {
  QueryPlan working = plan;
  return select_sql(working);
}

std::string Grammar::select_sql(QueryPlan& plan) const {
  if ((!plan.unions.empty() || !plan.havings.empty()) && plan.aggregate.has_value()) {
    return compile_union_aggregate(plan);
  }

  if (plan.group_limit.has_value()) {
    if (!plan.columns.has_value()) {
      plan.columns = std::vector<Identifier>{"*"};
    }
    return compile_group_limit(plan);
  }

  std::optional<std::vector<Identifier>> original = plan.columns;
  if (!plan.columns.has_value()) {
    plan.columns = std::vector<Identifier>{"*"};
  }

  std::string sql = util::trim_ws(concatenate(compile_components(plan)));
  if (!plan.unions.empty()) {
    sql = "(" + sql + ") " + compile_unions(plan);
  }

  plan.columns = std::move(original);
  return sql;
}

std::string Grammar::compile_union_aggregate(QueryPlan& plan) const {
  VLOG(1) << "sqlforge: compiling aggregate over derived union/having table";
  std::string sql = compile_aggregate(plan, *plan.aggregate);
  plan.aggregate.reset();
  return sql + " from (" + select_sql(plan) + ") as " + wrap_table(std::string(kUnionAggregateTable));
}

std::string Grammar::compile_group_limit(QueryPlan& plan) const {
  // The window function absorbs the order by, so its bindings move ahead of from/join/where.
  std::vector<Value>& select_bindings = plan.bindings[BindingGroup::Select];
  std::vector<Value>& order_bindings = plan.bindings[BindingGroup::Order];
  select_bindings.insert(select_bindings.end(), order_bindings.begin(), order_bindings.end());
  order_bindings.clear();

  int64_t limit = plan.group_limit->value;
  std::optional<int64_t> offset = plan.offset;
  if (offset.has_value()) {
    limit += *offset;
    plan.offset.reset();
  }
  VLOG(1) << "sqlforge: emulating group limit on '" << plan.group_limit->column << "' with limit " << limit;

  Components components = compile_components(plan);
  std::optional<std::string>& columns = components[static_cast<size_t>(Component::Columns)];
  std::optional<std::string>& orders = components[static_cast<size_t>(Component::Orders)];
  columns = columns.value_or("") + compile_row_number(plan.group_limit->column, orders.value_or(""));
  orders.reset();

  std::string table = wrap(std::string(kGroupLimitTable));
  std::string row = wrap(std::string(kGroupLimitRow));

  std::string sql = "select * from (" + concatenate(components) + ") as " + table + " where " + row +
                    " <= " + std::to_string(limit);
  if (offset.has_value()) {
    sql += " and " + row + " > " + std::to_string(*offset);
  }
  return sql + " order by " + row;
}

std::string Grammar::compile_row_number(const std::string& partition, const std::string& orders) const {
  std::string over = util::trim_ws("partition by " + wrap(partition) + " " + orders);
  return ", row_number() over (" + over + ") as " + wrap(std::string(kGroupLimitRow));
}

std::string Grammar::compile_unions(const QueryPlan& plan) const {
  std::string sql;
  for (const auto& union_spec : plan.unions) {
    if (!union_spec.query) throw MalformedPlan("Union is missing its query");
    sql += union_spec.all ? " union all " : " union ";
    sql += "(" + compile_select_sql(*union_spec.query) + ")";
  }
  if (!plan.union_orders.empty()) {
    sql += " " + compile_orders(plan.union_orders);
  }
  if (plan.union_limit.has_value()) {
    sql += " limit " + std::to_string(*plan.union_limit);
  }
  if (plan.union_offset.has_value()) {
    sql += " offset " + std::to_string(*plan.union_offset);
  }
  return util::ltrim_ws(sql);
}

CompiledQuery Grammar::compile_exists(const QueryPlan& plan) const {
  CompiledQuery select = compile_select(plan);
  select.sql = "select exists(" + select.sql + ") as " + wrap(std::string("exists"));
  return select;
}

std::string Grammar::to_raw_sql(const QueryPlan& plan) const {
  CompiledQuery compiled = compile_select(plan);
  return substitute_bindings_into_raw_sql(compiled.sql, compiled.bindings);
}

}  // namespace sqlforge
