#include "sqlforge/query_plan.h"

#include "sqlforge/dialect.h"

namespace sqlforge {

namespace {

void append(std::vector<Value>& out, const Value& value) {
  if (!value.is_expression()) out.push_back(value);
}

void append(std::vector<Value>& out, const std::vector<Value>& values) {
  for (const auto& value : values) append(out, value);
}

void append_json_document(std::vector<Value>& out, const Value& value, const Dialect& dialect) {
  if (!value.is_expression()) out.push_back(Value(dialect.prepare_binding_for_json_contains(value)));
}

struct PredicateBindings {
  std::vector<Value>& out;
  const Dialect& dialect;

  void operator()(const where::Raw&) const {}
  void operator()(const where::Basic& where) const { append(out, where.value); }
  void operator()(const where::Bitwise& where) const { append(out, where.value); }
  void operator()(const where::Like& where) const { append(out, where.value); }
  void operator()(const where::In& where) const { append(out, where.values); }
  void operator()(const where::NotIn& where) const { append(out, where.values); }
  void operator()(const where::InRaw&) const {}
  void operator()(const where::NotInRaw&) const {}
  void operator()(const where::Null&) const {}
  void operator()(const where::NotNull&) const {}
  void operator()(const where::Between& where) const { append(out, where.values); }
  void operator()(const where::BetweenColumns&) const {}
  void operator()(const where::ValueBetween& where) const { append(out, where.value); }
  void operator()(const where::DatePart& where) const { append(out, where.value); }
  void operator()(const where::ColumnCompare&) const {}

  void operator()(const where::Nested& where) const {
    if (where.query) append(out, derive_bindings(*where.query, dialect)[BindingGroup::Where]);
  }

  void operator()(const where::Sub& where) const {
    if (where.query) append(out, derive_bindings(*where.query, dialect).flatten());
  }

  void operator()(const where::Exists& where) const {
    if (where.query) append(out, derive_bindings(*where.query, dialect).flatten());
  }

  void operator()(const where::RowValues& where) const { append(out, where.values); }
  void operator()(const where::JsonBoolean& where) const { append(out, where.value); }
  void operator()(const where::JsonContains& where) const { append_json_document(out, where.value, dialect); }
  void operator()(const where::JsonOverlaps& where) const { append_json_document(out, where.value, dialect); }
  void operator()(const where::JsonContainsKey&) const {}
  void operator()(const where::JsonLength& where) const { append(out, where.value); }
  void operator()(const where::FullText& where) const { append(out, where.value); }
  void operator()(const where::ExpressionPredicate&) const {}
};

struct HavingBindings {
  std::vector<Value>& out;
  const Dialect& dialect;

  void operator()(const having::Raw&) const {}
  void operator()(const having::Basic& having) const { append(out, having.value); }
  void operator()(const having::Between& having) const { append(out, having.values); }
  void operator()(const having::Null&) const {}
  void operator()(const having::NotNull&) const {}
  void operator()(const having::Bit& having) const { append(out, having.value); }
  void operator()(const having::ExpressionPredicate&) const {}

  void operator()(const having::Nested& having) const {
    if (having.query) append(out, derive_bindings(*having.query, dialect)[BindingGroup::Having]);
  }
};

void collect_predicates(const std::vector<Predicate>& predicates, std::vector<Value>& out, const Dialect& dialect) {
  for (const auto& predicate : predicates) {
    std::visit(PredicateBindings{out, dialect}, predicate.body);
  }
}

// Compiled join text walks each join's target before its "on" list, nested groups first.
void collect_joins(const std::vector<JoinSpec>& joins, std::vector<Value>& out, const Dialect& dialect) {
  for (const auto& join : joins) {
    collect_joins(join.joins, out, dialect);
    collect_predicates(join.wheres, out, dialect);
  }
}

}  // namespace

Bindings derive_bindings(const QueryPlan& plan, const Dialect& dialect) {
  Bindings bindings;
  collect_joins(plan.joins, bindings[BindingGroup::Join], dialect);
  collect_predicates(plan.wheres, bindings[BindingGroup::Where], dialect);
  for (const auto& having : plan.havings) {
    std::visit(HavingBindings{bindings[BindingGroup::Having], dialect}, having.body);
  }
  for (const auto& union_spec : plan.unions) {
    if (union_spec.query) {
      append(bindings[BindingGroup::Union], derive_bindings(*union_spec.query, dialect).flatten());
    }
  }
  return bindings;
}

Bindings derive_bindings(const QueryPlan& plan) {
  static const Dialect default_dialect{};
  return derive_bindings(plan, default_dialect);
}

}  // namespace sqlforge
