#include "sqlforge/grammar.h"

#include "../util/string_util.h"

namespace sqlforge {

namespace {

bool distinct_requested(const std::variant<bool, std::vector<Identifier>>& distinct) {
  if (const auto* flag = std::get_if<bool>(&distinct)) return *flag;
  return !std::get<std::vector<Identifier>>(distinct).empty();
}

}  // namespace

Grammar::Components Grammar::compile_components(const QueryPlan& plan) const {
  Components out;
  auto set = [&out](Component component, std::string sql) {
    out[static_cast<size_t>(component)] = std::move(sql);
  };

  if (plan.aggregate.has_value()) {
    set(Component::Aggregate, compile_aggregate(plan, *plan.aggregate));
  }
  if (plan.columns.has_value()) {
    set(Component::Columns, compile_columns(plan, *plan.columns));
  }
  if (plan.from.has_value()) {
    set(Component::From, "from " + wrap_table(*plan.from));
  }
  if (plan.index_hint.has_value()) {
    set(Component::IndexHint, dialect_->compile_index_hint(*this, plan, *plan.index_hint));
  }
  if (!plan.joins.empty()) {
    set(Component::Joins, compile_joins(plan.joins));
  }
  if (!plan.wheres.empty()) {
    set(Component::Wheres, compile_wheres(plan));
  }
  if (!plan.groups.empty()) {
    set(Component::Groups, "group by " + columnize(plan.groups));
  }
  if (!plan.havings.empty()) {
    set(Component::Havings, compile_havings(plan.havings));
  }
  if (!plan.orders.empty()) {
    set(Component::Orders, compile_orders(plan.orders));
  }
  if (plan.limit.has_value()) {
    set(Component::Limit, "limit " + std::to_string(*plan.limit));
  }
  if (plan.offset.has_value()) {
    set(Component::Offset, "offset " + std::to_string(*plan.offset));
  }
  if (plan.lock.has_value()) {
    set(Component::Lock, dialect_->compile_lock(*this, plan, *plan.lock));
  }
  return out;
}

std::string Grammar::concatenate(const Components& components) {
  std::vector<std::string> parts;
  for (const auto& component : components) {
    if (component.has_value() && !component->empty()) {
      parts.push_back(*component);
    }
  }
  return util::join(parts, " ");
}

std::string Grammar::compile_aggregate(const QueryPlan& plan, const Aggregate& aggregate) const {
  std::string column = columnize(aggregate.columns);

  // Distinct must wrap the aggregated column so the engine applies it before aggregating.
  if (const auto* distinct_columns = std::get_if<std::vector<Identifier>>(&plan.distinct)) {
    if (!distinct_columns->empty()) {
      column = "distinct " + columnize(*distinct_columns);
    }
  } else if (std::get<bool>(plan.distinct) && column != "*") {
    column = "distinct " + column;
  }

  return "select " + aggregate.function + "(" + column + ") as aggregate";
}

std::string Grammar::compile_columns(const QueryPlan& plan, const std::vector<Identifier>& columns) const {
  if (plan.aggregate.has_value()) return "";
  std::string select = distinct_requested(plan.distinct) ? "select distinct " : "select ";
  return select + columnize(columns);
}

std::string Grammar::compile_joins(const std::vector<JoinSpec>& joins) const {
  std::vector<std::string> parts;
  parts.reserve(joins.size());
  for (const auto& join : joins) {
    std::string table = wrap_table(join.table);
    std::string table_and_nested =
        join.joins.empty() ? table : "(" + table + " " + compile_joins(join.joins) + ")";
    if (join.lateral) {
      parts.push_back(dialect_->compile_join_lateral(*this, join, table_and_nested));
      continue;
    }
    parts.push_back(util::trim_ws(join.type + " join " + table_and_nested + " " + compile_wheres(join)));
  }
  return util::join(parts, " ");
}

std::string Grammar::compile_orders(const std::vector<OrderSpec>& orders) const {
  if (orders.empty()) return "";
  std::vector<std::string> parts;
  parts.reserve(orders.size());
  for (const auto& order : orders) {
    if (order.sql.has_value()) {
      parts.push_back(*order.sql);
    } else {
      parts.push_back(wrap(order.column) + " " + order.direction);
    }
  }
  return "order by " + util::join(parts, ", ");
}

}  // namespace sqlforge
