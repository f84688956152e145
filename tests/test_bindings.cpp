#include "test_harness.h"

#include <vector>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

namespace where = sqlforge::where;
namespace having = sqlforge::having;
using sqlforge::BindingGroup;
using sqlforge::Bindings;
using sqlforge::Grammar;
using sqlforge::QueryPlan;
using sqlforge::Value;

Bindings one_per_group() {
  Bindings bindings;
  for (size_t g = 0; g < sqlforge::kBindingGroupCount; ++g) {
    bindings.groups[g] = {Value(static_cast<int64_t>(g))};
  }
  return bindings;
}

void test_flatten_follows_group_order() {
  std::vector<Value> flat = one_per_group().flatten();
  expect_eq(flat.size(), sqlforge::kBindingGroupCount, "one value per group");
  bool ordered = true;
  for (size_t i = 0; i < flat.size(); ++i) {
    ordered = ordered && flat[i] == Value(static_cast<int64_t>(i));
  }
  expect_true(ordered, "select, from, join, where, groupBy, having, order, union, unionOrder");
  expect_eq(sqlforge::binding_group_name(BindingGroup::GroupBy), "groupBy", "group name");
  expect_eq(sqlforge::binding_group_name(BindingGroup::UnionOrder), "unionOrder", "union order name");
}

void test_update_bindings_put_join_and_values_first() {
  Bindings bindings = one_per_group();
  sqlforge::Assignments values{{"a", Value("v")}};
  std::vector<Value> out = Grammar().prepare_bindings_for_update(bindings, values);
  expect_eq(out.size(), sqlforge::kBindingGroupCount, "select dropped, value added");
  if (out.size() != sqlforge::kBindingGroupCount) return;
  expect_true(out[0] == Value(static_cast<int64_t>(BindingGroup::Join)), "join first");
  expect_true(out[1] == Value("v"), "assigned value second");
  expect_true(out[2] == Value(static_cast<int64_t>(BindingGroup::From)), "remaining groups follow in order");
  expect_true(out[3] == Value(static_cast<int64_t>(BindingGroup::Where)), "where after from");
}

void test_delete_bindings_exclude_select() {
  std::vector<Value> out = Grammar().prepare_bindings_for_delete(one_per_group());
  expect_eq(out.size(), sqlforge::kBindingGroupCount - 1, "select dropped");
  if (out.empty()) return;
  expect_true(out[0] == Value(static_cast<int64_t>(BindingGroup::From)), "from first");
}

void test_derive_bindings_groups_values_by_clause() {
  QueryPlan nested;
  nested.wheres = {where_pred(where::Basic{"n", "=", "nested"})};
  QueryPlan sub = table_plan("orders");
  sub.wheres = {where_pred(where::Basic{"s", "=", "sub"})};
  QueryPlan other = table_plan("admins");
  other.wheres = {where_pred(where::Basic{"u", "=", "union"})};

  QueryPlan plan = table_plan("users");
  sqlforge::JoinSpec join;
  join.table = "contacts";
  join.wheres = {where_pred(where::Basic{"contacts.kind", "=", "join"})};
  plan.joins = {join};
  plan.wheres = {
      where_pred(where::In{"id", {1, 2}}),
      where_pred(where::InRaw{"code", {3}}),
      where_pred(where::Basic{"created_at", "<", sqlforge::raw("now()")}),
      where_pred(where::Nested{share(nested)}),
      where_pred(where::Exists{share(sub)}),
  };
  plan.havings = {having_pred(having::Between{"total", {10, 20}})};
  plan.unions = {sqlforge::UnionSpec{share(other), false}};

  Bindings bindings = sqlforge::derive_bindings(plan);
  expect_eq(bindings[BindingGroup::Join].size(), 1, "join bindings");
  const std::vector<Value>& wheres = bindings[BindingGroup::Where];
  expect_eq(wheres.size(), 4, "in values, nested and exists; raw list and expression skipped");
  if (wheres.size() == 4) {
    expect_true(wheres[2] == Value("nested") && wheres[3] == Value("sub"), "sub-plan bindings in place");
  }
  expect_eq(bindings[BindingGroup::Having].size(), 2, "having bindings");
  expect_eq(bindings[BindingGroup::Union].size(), 1, "union bindings");
}

void test_json_contains_binding_is_json_encoded() {
  Grammar grammar;
  expect_eq(grammar.prepare_binding_for_json_contains(Value("a\"b")), "\"a\\\"b\"", "string encoded");
  expect_eq(grammar.prepare_binding_for_json_contains(Value(3)), "3", "integer encoded");
  expect_eq(grammar.prepare_binding_for_json_contains(Value()), "null", "null encoded");
}

void test_json_contains_binding_rejects_invalid_utf8() {
  Grammar grammar;
  std::string message;
  bool thrown = throws_as<sqlforge::MalformedPlan>(
      [&] { grammar.prepare_binding_for_json_contains(Value(std::string("\xff\xfe"))); }, &message);
  expect_true(thrown, "invalid UTF-8 rejected as malformed plan");
  expect_eq(message, "Strings with invalid UTF-8 byte sequences cannot be encoded as JSON.", "message");
  expect_eq(grammar.prepare_binding_for_json_contains(Value(1.5)), "1.5", "doubles still encode");
}

void test_derive_bindings_encodes_json_documents() {
  QueryPlan plan = table_plan("users");
  plan.wheres = {where_pred(where::JsonContains{"tags", "php"}), where_pred(where::JsonOverlaps{"tags", 7}),
                 where_pred(where::JsonContains{"tags", sqlforge::raw("'[]'")})};
  Bindings bindings = sqlforge::derive_bindings(plan);
  const std::vector<Value>& wheres = bindings[BindingGroup::Where];
  expect_eq(wheres.size(), 2, "expression document skipped");
  if (wheres.size() == 2) {
    expect_true(wheres[0] == Value("\"php\""), "string document encoded");
    expect_true(wheres[1] == Value("7"), "integer document encoded");
  }
}

}  // namespace

void register_binding_tests(std::vector<TestCase>& tests) {
  tests.push_back({"flatten_follows_group_order", test_flatten_follows_group_order});
  tests.push_back({"update_bindings_put_join_and_values_first", test_update_bindings_put_join_and_values_first});
  tests.push_back({"delete_bindings_exclude_select", test_delete_bindings_exclude_select});
  tests.push_back({"derive_bindings_groups_values_by_clause", test_derive_bindings_groups_values_by_clause});
  tests.push_back({"json_contains_binding_is_json_encoded", test_json_contains_binding_is_json_encoded});
  tests.push_back({"json_contains_binding_rejects_invalid_utf8", test_json_contains_binding_rejects_invalid_utf8});
  tests.push_back({"derive_bindings_encodes_json_documents", test_derive_bindings_encodes_json_documents});
}
