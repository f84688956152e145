#include "test_harness.h"

#include <vector>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

using sqlforge::Blob;
using sqlforge::Grammar;
using sqlforge::Value;

void test_substitution_skips_literals_and_escapes() {
  Grammar grammar;
  std::string sql = "select * from t where a = ? and b = '??' and c = 'it''s'";
  expect_eq(grammar.substitute_bindings_into_raw_sql(sql, {5}),
            "select * from t where a = 5 and b = '??' and c = 'it''s'", "only the bare placeholder is replaced");
}

void test_placeholder_inside_literal_is_kept() {
  Grammar grammar;
  expect_eq(grammar.substitute_bindings_into_raw_sql("a = '?' and b = ?", {1}), "a = '?' and b = 1",
            "quoted placeholder kept");
  expect_eq(grammar.substitute_bindings_into_raw_sql("a = 'x\\'?' and b = ?", {7}), "a = 'x\\'?' and b = 7",
            "backslash-escaped quote does not end the literal");
}

void test_escaped_placeholder_outside_literal_is_kept() {
  Grammar grammar;
  expect_eq(grammar.substitute_bindings_into_raw_sql("tags ??| ? and x = ?", {"a", 2}), "tags ??| 'a' and x = 2",
            "operator escape kept");
}

void test_exhausted_bindings_leave_placeholders() {
  Grammar grammar;
  expect_eq(grammar.substitute_bindings_into_raw_sql("a = ? and b = ?", {1}), "a = 1 and b = ?",
            "extra placeholder stays");
}

void test_escape_renders_literals() {
  Grammar grammar;
  expect_eq(grammar.escape(Value()), "null", "null");
  expect_eq(grammar.escape(Value(true)), "1", "true");
  expect_eq(grammar.escape(Value(false)), "0", "false");
  expect_eq(grammar.escape(Value(-12)), "-12", "integer");
  expect_eq(grammar.escape(Value(2.5)), "2.5", "double");
  expect_eq(grammar.escape(Value("it's")), "'it''s'", "string quotes doubled");
  expect_eq(grammar.escape(Value(sqlforge::raw("now()"))), "now()", "expression rendered");
}

void test_escape_rejects_unsafe_strings() {
  Grammar grammar;
  expect_true(throws_as<sqlforge::MalformedPlan>([&] { grammar.escape(Value(std::string("a\0b", 3))); }),
              "NUL byte rejected");
  expect_true(throws_as<sqlforge::MalformedPlan>([&] { grammar.escape(Value(std::string("\xff"))); }),
              "invalid UTF-8 rejected");
  expect_eq(grammar.escape(Value(std::string("caf\xc3\xa9"))), "'caf\xc3\xa9'", "valid UTF-8 accepted");
}

void test_binary_escape_depends_on_dialect() {
  Blob blob{{0x01, 0xab}};
  expect_true(throws_as<sqlforge::UnsupportedOperation>([&] { Grammar().escape(Value(blob)); }),
              "default dialect cannot escape binary");
  Grammar ansi = ansi_grammar();
  expect_eq(ansi.escape(Value(blob)), "X'01AB'", "hex literal");
  expect_eq(ansi.escape(Value("AB"), true), "X'4142'", "string escaped as binary");
}

}  // namespace

void register_raw_sql_tests(std::vector<TestCase>& tests) {
  tests.push_back({"substitution_skips_literals_and_escapes", test_substitution_skips_literals_and_escapes});
  tests.push_back({"placeholder_inside_literal_is_kept", test_placeholder_inside_literal_is_kept});
  tests.push_back({"escaped_placeholder_outside_literal_is_kept", test_escaped_placeholder_outside_literal_is_kept});
  tests.push_back({"exhausted_bindings_leave_placeholders", test_exhausted_bindings_leave_placeholders});
  tests.push_back({"escape_renders_literals", test_escape_renders_literals});
  tests.push_back({"escape_rejects_unsafe_strings", test_escape_rejects_unsafe_strings});
  tests.push_back({"binary_escape_depends_on_dialect", test_binary_escape_depends_on_dialect});
}
