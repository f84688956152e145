#include "sqlforge/grammar.h"

#include "sqlforge/errors.h"
#include "../util/string_util.h"

namespace sqlforge {

namespace {

constexpr const char* kWherePrefix = "where ";
constexpr const char* kOnPrefix = "on ";
constexpr const char* kHavingPrefix = "having ";

const char* prefix_for(ClauseContext context) {
  return context == ClauseContext::On ? kOnPrefix : kWherePrefix;
}

std::string between_keyword(bool negate) {
  return negate ? "not between" : "between";
}

template <typename T>
void require_endpoint_pair(const std::vector<T>& values, const char* what) {
  if (values.size() != 2) {
    throw MalformedPlan(std::string(what) + " requires exactly two endpoints, got " +
                        std::to_string(values.size()));
  }
}

const char* date_part_function(where::DatePart::Part part) {
  switch (part) {
    case where::DatePart::Part::Date:
      return "date";
    case where::DatePart::Part::Time:
      return "time";
    case where::DatePart::Part::Day:
      return "day";
    case where::DatePart::Part::Month:
      return "month";
    case where::DatePart::Part::Year:
      return "year";
  }
  return "date";
}

/// Exhaustive over PredicateBody: a variant without an overload fails to compile.
struct WhereCompiler {
  const Grammar& grammar;
  ClauseContext context;

  std::string operator()(const where::Raw& where) const {
    return raw_text(where.sql);
  }

  std::string operator()(const where::Basic& where) const {
    return basic(where.column, where.op, where.value);
  }

  std::string operator()(const where::Bitwise& where) const {
    return basic(where.column, where.op, where.value);
  }

  std::string operator()(const where::Like& where) const {
    if (where.case_sensitive) {
      return grammar.dialect().compile_case_sensitive_like(grammar, where);
    }
    return basic(where.column, where.negate ? "not like" : "like", where.value);
  }

  std::string operator()(const where::In& where) const {
    if (where.values.empty()) return "0 = 1";
    return grammar.wrap(where.column) + " in (" + grammar.parameterize(where.values) + ")";
  }

  std::string operator()(const where::NotIn& where) const {
    if (where.values.empty()) return "1 = 1";
    return grammar.wrap(where.column) + " not in (" + grammar.parameterize(where.values) + ")";
  }

  std::string operator()(const where::InRaw& where) const {
    if (where.values.empty()) return "0 = 1";
    return grammar.wrap(where.column) + " in (" + grammar.dialect().compile_integer_list(where.values) + ")";
  }

  std::string operator()(const where::NotInRaw& where) const {
    if (where.values.empty()) return "1 = 1";
    return grammar.wrap(where.column) + " not in (" +
           grammar.dialect().compile_integer_list(where.values) + ")";
  }

  std::string operator()(const where::Null& where) const {
    return grammar.wrap(where.column) + " is null";
  }

  std::string operator()(const where::NotNull& where) const {
    return grammar.wrap(where.column) + " is not null";
  }

  std::string operator()(const where::Between& where) const {
    require_endpoint_pair(where.values, "between");
    return grammar.wrap(where.column) + " " + between_keyword(where.negate) + " " +
           grammar.parameter(where.values.front()) + " and " + grammar.parameter(where.values.back());
  }

  std::string operator()(const where::BetweenColumns& where) const {
    require_endpoint_pair(where.bounds, "between columns");
    return grammar.wrap(where.column) + " " + between_keyword(where.negate) + " " +
           grammar.wrap(where.bounds.front()) + " and " + grammar.wrap(where.bounds.back());
  }

  std::string operator()(const where::ValueBetween& where) const {
    require_endpoint_pair(where.columns, "value between");
    return grammar.parameter(where.value) + " " + between_keyword(where.negate) + " " +
           grammar.wrap(where.columns.front()) + " and " + grammar.wrap(where.columns.back());
  }

  std::string operator()(const where::DatePart& where) const {
    return std::string(date_part_function(where.part)) + "(" + grammar.wrap(where.column) + ") " +
           where.op + " " + grammar.parameter(where.value);
  }

  std::string operator()(const where::ColumnCompare& where) const {
    return grammar.wrap(where.first) + " " + where.op + " " + grammar.wrap(where.second);
  }

  std::string operator()(const where::Nested& where) const {
    if (!where.query) throw MalformedPlan("Nested where clause is missing its query");
    if (where.query->wheres.empty()) throw MalformedPlan("Nested where clause has no predicates");
    std::string inner = grammar.compile_predicates(where.query->wheres, context);
    return "(" + util::strip_known_prefix(inner, prefix_for(context)) + ")";
  }

  std::string operator()(const where::Sub& where) const {
    if (!where.query) throw MalformedPlan("Sub-select where clause is missing its query");
    return grammar.wrap(where.column) + " " + where.op + " (" + grammar.compile_select_sql(*where.query) + ")";
  }

  std::string operator()(const where::Exists& where) const {
    if (!where.query) throw MalformedPlan("Exists where clause is missing its query");
    return std::string(where.negate ? "not exists (" : "exists (") + grammar.compile_select_sql(*where.query) + ")";
  }

  std::string operator()(const where::RowValues& where) const {
    if (where.columns.size() != where.values.size()) {
      throw MalformedPlan("Row values comparison has " + std::to_string(where.columns.size()) +
                          " columns but " + std::to_string(where.values.size()) + " values");
    }
    return "(" + grammar.columnize(where.columns) + ") " + where.op + " (" + grammar.parameterize(where.values) + ")";
  }

  std::string operator()(const where::JsonBoolean& where) const {
    const Dialect& dialect = grammar.dialect();
    std::string column =
        dialect.wrap_json_boolean_selector(grammar, grammar.decompose_json_selector(where.column));
    std::string value = dialect.wrap_json_boolean_value(grammar.parameter(where.value));
    return column + " " + where.op + " " + value;
  }

  std::string operator()(const where::JsonContains& where) const {
    return std::string(where.negate ? "not " : "") +
           grammar.dialect().compile_json_contains(grammar, where.column, grammar.parameter(where.value));
  }

  std::string operator()(const where::JsonOverlaps& where) const {
    return std::string(where.negate ? "not " : "") +
           grammar.dialect().compile_json_overlaps(grammar, where.column, grammar.parameter(where.value));
  }

  std::string operator()(const where::JsonContainsKey& where) const {
    return std::string(where.negate ? "not " : "") +
           grammar.dialect().compile_json_contains_key(grammar, where.column);
  }

  std::string operator()(const where::JsonLength& where) const {
    return grammar.dialect().compile_json_length(grammar, where.column, where.op,
                                                 grammar.parameter(where.value));
  }

  std::string operator()(const where::FullText& where) const {
    return grammar.dialect().compile_full_text(grammar, where);
  }

  std::string operator()(const where::ExpressionPredicate& where) const {
    if (!where.expression) throw MalformedPlan("Expression where clause is missing its expression");
    return grammar.get_value(*where.expression);
  }

 private:
  std::string raw_text(const Identifier& sql) const {
    if (const auto* expression = std::get_if<ExpressionPtr>(&sql)) {
      return grammar.get_value(**expression);
    }
    return std::get<std::string>(sql);
  }

  std::string basic(const Identifier& column, const std::string& op, const Value& value) const {
    // `?` inside an operator (e.g. `?|`) must not read as a placeholder.
    return grammar.wrap(column) + " " + util::replace_all(op, "?", "??") + " " + grammar.parameter(value);
  }
};

struct HavingCompiler {
  const Grammar& grammar;

  std::string operator()(const having::Raw& having) const {
    return having.sql;
  }

  std::string operator()(const having::Basic& having) const {
    return grammar.wrap(having.column) + " " + having.op + " " + grammar.parameter(having.value);
  }

  std::string operator()(const having::Between& having) const {
    require_endpoint_pair(having.values, "having between");
    return grammar.wrap(having.column) + " " + between_keyword(having.negate) + " " +
           grammar.parameter(having.values.front()) + " and " + grammar.parameter(having.values.back());
  }

  std::string operator()(const having::Null& having) const {
    return grammar.wrap(having.column) + " is null";
  }

  std::string operator()(const having::NotNull& having) const {
    return grammar.wrap(having.column) + " is not null";
  }

  std::string operator()(const having::Bit& having) const {
    return "(" + grammar.wrap(having.column) + " " + having.op + " " + grammar.parameter(having.value) + ") != 0";
  }

  std::string operator()(const having::ExpressionPredicate& having) const {
    if (!having.expression) throw MalformedPlan("Expression having clause is missing its expression");
    return grammar.get_value(*having.expression);
  }

  std::string operator()(const having::Nested& having) const {
    if (!having.query) throw MalformedPlan("Nested having clause is missing its query");
    if (having.query->havings.empty()) throw MalformedPlan("Nested having clause has no predicates");
    return "(" + util::strip_known_prefix(grammar.compile_havings(having.query->havings), kHavingPrefix) + ")";
  }
};

}  // namespace

std::string Grammar::compile_wheres(const QueryPlan& plan) const {
  return compile_predicates(plan.wheres, ClauseContext::Where);
}

std::string Grammar::compile_wheres(const JoinSpec& join) const {
  return compile_predicates(join.wheres, ClauseContext::On);
}

std::string Grammar::compile_predicates(const std::vector<Predicate>& predicates, ClauseContext context) const {
  if (predicates.empty()) return "";
  std::vector<std::string> parts;
  parts.reserve(predicates.size());
  for (const auto& predicate : predicates) {
    parts.push_back(predicate.boolean + " " + compile_predicate(predicate, context));
  }
  return std::string(prefix_for(context)) + util::remove_leading_boolean(util::join(parts, " "));
}

std::string Grammar::compile_predicate(const Predicate& predicate, ClauseContext context) const {
  return std::visit(WhereCompiler{*this, context}, predicate.body);
}

std::string Grammar::compile_havings(const std::vector<HavingPredicate>& havings) const {
  if (havings.empty()) return "";
  std::vector<std::string> parts;
  parts.reserve(havings.size());
  for (const auto& having : havings) {
    parts.push_back(having.boolean + " " + compile_having(having));
  }
  return std::string(kHavingPrefix) + util::remove_leading_boolean(util::join(parts, " "));
}

std::string Grammar::compile_having(const HavingPredicate& having) const {
  return std::visit(HavingCompiler{*this}, having.body);
}

}  // namespace sqlforge
