#include "test_harness.h"

#include <vector>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

namespace where = sqlforge::where;
using sqlforge::Grammar;
using sqlforge::JoinSpec;
using sqlforge::QueryPlan;

JoinSpec join_on(const std::string& type, const std::string& table, const std::string& first,
                 const std::string& second) {
  JoinSpec join;
  join.type = type;
  join.table = table;
  join.wheres = {where_pred(where::ColumnCompare{first, "=", second})};
  return join;
}

void test_inner_join_compiles_on_clause() {
  QueryPlan plan = table_plan("users");
  plan.joins = {join_on("inner", "contacts", "users.id", "contacts.user_id")};
  expect_eq(Grammar().compile_select(plan).sql,
            "select * from users inner join contacts on users.id = contacts.user_id", "inner join");
}

void test_join_predicates_collect_join_bindings() {
  QueryPlan plan = table_plan("users");
  JoinSpec join = join_on("left", "orders", "users.id", "orders.user_id");
  join.wheres.push_back(where_pred(where::Basic{"orders.status", "=", "paid"}));
  plan.joins = {join};
  plan.wheres = {where_pred(where::Basic{"users.active", "=", true})};
  sqlforge::CompiledQuery compiled = Grammar().compile_select(bound(plan));
  expect_eq(compiled.sql,
            "select * from users left join orders on users.id = orders.user_id and orders.status = ? "
            "where users.active = ?",
            "join with value predicate");
  expect_eq(compiled.bindings.size(), 2, "two bindings");
  if (compiled.bindings.size() != 2) return;
  expect_true(compiled.bindings[0] == sqlforge::Value("paid"), "join binding first");
  expect_true(compiled.bindings[1] == sqlforge::Value(true), "where binding second");
}

void test_nested_join_is_parenthesized() {
  QueryPlan plan = table_plan("users");
  JoinSpec join = join_on("left", "contacts", "users.id", "contacts.user_id");
  join.joins = {join_on("inner", "contact_types", "contacts.type_id", "contact_types.id")};
  plan.joins = {join};
  expect_eq(Grammar().compile_select(plan).sql,
            "select * from users left join (contacts inner join contact_types on contacts.type_id = "
            "contact_types.id) on users.id = contacts.user_id",
            "nested join group");
}

void test_nested_predicate_inside_join_strips_on_keyword() {
  QueryPlan inner;
  inner.wheres = {where_pred(where::ColumnCompare{"a.id", "=", "b.a_id"}),
                  where_pred(where::Basic{"b.kind", "=", 1}, "or")};
  QueryPlan plan = table_plan("a");
  JoinSpec join;
  join.table = "b";
  join.wheres = {where_pred(where::Nested{share(inner)})};
  plan.joins = {join};
  expect_eq(Grammar().compile_select(plan).sql, "select * from a inner join b on (a.id = b.a_id or b.kind = ?)",
            "nested join predicate");
}

void test_cross_join_without_predicates() {
  QueryPlan plan = table_plan("sizes");
  JoinSpec join;
  join.type = "cross";
  join.table = "colors";
  plan.joins = {join};
  expect_eq(Grammar().compile_select(plan).sql, "select * from sizes cross join colors", "cross join");
}

void test_aliased_join_is_quoted() {
  QueryPlan plan = table_plan("users as u");
  plan.joins = {join_on("inner", "contacts as c", "u.id", "c.user_id")};
  expect_eq(ansi_grammar().compile_select(plan).sql,
            "select * from \"users\" as \"u\" inner join \"contacts\" as \"c\" on \"u\".\"id\" = \"c\".\"user_id\"",
            "aliases quoted");
}

void test_lateral_join_unsupported_by_default() {
  QueryPlan plan = table_plan("users");
  JoinSpec join;
  join.table = sqlforge::raw("(select * from orders) as o");
  join.lateral = true;
  plan.joins = {join};
  std::string message;
  bool thrown = throws_as<sqlforge::UnsupportedOperation>([&] { Grammar().compile_select(plan); }, &message);
  expect_true(thrown, "lateral join rejected");
  expect_eq(message, "This database engine does not support lateral joins.", "message");
}

}  // namespace

void register_join_tests(std::vector<TestCase>& tests) {
  tests.push_back({"inner_join_compiles_on_clause", test_inner_join_compiles_on_clause});
  tests.push_back({"join_predicates_collect_join_bindings", test_join_predicates_collect_join_bindings});
  tests.push_back({"nested_join_is_parenthesized", test_nested_join_is_parenthesized});
  tests.push_back({"nested_predicate_inside_join_strips_on_keyword",
                   test_nested_predicate_inside_join_strips_on_keyword});
  tests.push_back({"cross_join_without_predicates", test_cross_join_without_predicates});
  tests.push_back({"aliased_join_is_quoted", test_aliased_join_is_quoted});
  tests.push_back({"lateral_join_unsupported_by_default", test_lateral_join_unsupported_by_default});
}
