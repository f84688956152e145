#include "test_harness.h"

#include <vector>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

namespace having = sqlforge::having;
using sqlforge::Grammar;
using sqlforge::QueryPlan;

std::string compile_having(const std::vector<sqlforge::HavingPredicate>& havings) {
  return Grammar().compile_havings(havings);
}

void test_having_variants_render() {
  expect_eq(compile_having({}), "", "no havings");
  expect_eq(compile_having({having_pred(having::Basic{"total", ">", 100})}), "having total > ?", "basic");
  expect_eq(compile_having({having_pred(having::Raw{"sum(x) > 10"})}), "having sum(x) > 10", "raw");
  expect_eq(compile_having({having_pred(having::Between{"total", {1, 5}, true})}),
            "having total not between ? and ?", "between");
  expect_eq(compile_having({having_pred(having::Null{"total"})}), "having total is null", "null");
  expect_eq(compile_having({having_pred(having::NotNull{"total"})}), "having total is not null", "not null");
  expect_eq(compile_having({having_pred(having::Bit{"flags", "&", 2})}), "having (flags & ?) != 0", "bit");
  expect_eq(compile_having({having_pred(having::ExpressionPredicate{sqlforge::raw("count(*) > 1")})}),
            "having count(*) > 1", "expression");
}

void test_having_conjunctions() {
  expect_eq(compile_having({having_pred(having::Basic{"a", "=", 1}, "or"),
                            having_pred(having::Basic{"b", "=", 2}, "or")}),
            "having a = ? or b = ?", "first conjunction dropped");
}

void test_nested_having_strips_keyword() {
  QueryPlan inner;
  inner.havings = {having_pred(having::Basic{"a", "=", 1}), having_pred(having::Basic{"b", "=", 2}, "or")};
  expect_eq(compile_having({having_pred(having::Basic{"c", "=", 3}), having_pred(having::Nested{share(inner)})}),
            "having c = ? and (a = ? or b = ?)", "nested having");
  expect_true(throws_as<sqlforge::MalformedPlan>(
                  [] { compile_having({having_pred(having::Nested{share(QueryPlan{})})}); }),
              "empty nested having rejected");
}

void test_having_between_requires_two_endpoints() {
  expect_true(throws_as<sqlforge::MalformedPlan>(
                  [] { compile_having({having_pred(having::Between{"total", {1}})}); }),
              "single endpoint rejected");
}

void test_select_with_group_and_having() {
  QueryPlan plan = table_plan("orders");
  plan.columns = std::vector<sqlforge::Identifier>{"user_id", sqlforge::raw("sum(total) as total")};
  plan.groups = {"user_id"};
  plan.havings = {having_pred(having::Basic{"total", ">", 100})};
  sqlforge::CompiledQuery compiled = Grammar().compile_select(bound(plan));
  expect_eq(compiled.sql, "select user_id, sum(total) as total from orders group by user_id having total > ?",
            "grouped select");
  expect_eq(compiled.bindings.size(), 1, "having binding");
}

}  // namespace

void register_having_tests(std::vector<TestCase>& tests) {
  tests.push_back({"having_variants_render", test_having_variants_render});
  tests.push_back({"having_conjunctions", test_having_conjunctions});
  tests.push_back({"nested_having_strips_keyword", test_nested_having_strips_keyword});
  tests.push_back({"having_between_requires_two_endpoints", test_having_between_requires_two_endpoints});
  tests.push_back({"select_with_group_and_having", test_select_with_group_and_having});
}
