#include "test_harness.h"

#include <vector>

#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

using sqlforge::Grammar;
using sqlforge::Value;

void test_parameter_is_placeholder_for_literals() {
  Grammar grammar;
  expect_eq(grammar.parameter(Value(1)), "?", "integer");
  expect_eq(grammar.parameter(Value("x")), "?", "string");
  expect_eq(grammar.parameter(Value()), "?", "null");
}

void test_parameter_inlines_expressions() {
  Grammar grammar;
  expect_eq(grammar.parameter(Value(sqlforge::raw("now()"))), "now()", "expression text");
}

void test_parameterize_joins_tokens() {
  Grammar grammar;
  std::vector<Value> values{1, sqlforge::raw("default"), "a"};
  expect_eq(grammar.parameterize(values), "?, default, ?", "mixed list");
  sqlforge::Record record{{"a", 1}, {"b", sqlforge::raw("b + 1")}};
  expect_eq(grammar.parameterize(record), "?, b + 1", "record values");
}

void test_columnize_wraps_each_column() {
  Grammar grammar = ansi_grammar();
  std::vector<sqlforge::Identifier> columns{"id", "users.name as n"};
  expect_eq(grammar.columnize(columns), "\"id\", \"users\".\"name\" as \"n\"", "wrapped list");
}

void test_clean_bindings_drops_expressions() {
  std::vector<Value> values{1, sqlforge::raw("now()"), "x"};
  std::vector<Value> cleaned = sqlforge::clean_bindings(values);
  expect_eq(cleaned.size(), 2, "expression removed");
  if (cleaned.size() != 2) return;
  expect_true(cleaned[0] == Value(1) && cleaned[1] == Value("x"), "order preserved");
}

void test_describe_value_renders_readable_text() {
  expect_eq(sqlforge::describe_value(Value()), "null", "null");
  expect_eq(sqlforge::describe_value(Value(true)), "true", "bool");
  expect_eq(sqlforge::describe_value(Value(42)), "42", "integer");
  expect_eq(sqlforge::describe_value(Value(1.5)), "1.5", "double");
  expect_eq(sqlforge::describe_value(Value("x")), "'x'", "string");
}

}  // namespace

void register_parameter_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parameter_is_placeholder_for_literals", test_parameter_is_placeholder_for_literals});
  tests.push_back({"parameter_inlines_expressions", test_parameter_inlines_expressions});
  tests.push_back({"parameterize_joins_tokens", test_parameterize_joins_tokens});
  tests.push_back({"columnize_wraps_each_column", test_columnize_wraps_each_column});
  tests.push_back({"clean_bindings_drops_expressions", test_clean_bindings_drops_expressions});
  tests.push_back({"describe_value_renders_readable_text", test_describe_value_renders_readable_text});
}
