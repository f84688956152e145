#include "test_harness.h"

#include <vector>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "test_support.h"

namespace {

using sqlforge::Grammar;
using sqlforge::GrammarOptions;

void test_wrap_quotes_qualified_segments() {
  Grammar grammar = ansi_grammar();
  expect_eq(grammar.wrap("users.name"), "\"users\".\"name\"", "qualified column");
  expect_eq(grammar.wrap("users.*"), "\"users\".*", "star segment stays bare");
  expect_eq(grammar.wrap("*"), "*", "bare star");
}

void test_wrap_handles_aliases_case_insensitively() {
  Grammar grammar = ansi_grammar();
  expect_eq(grammar.wrap("name as n"), "\"name\" as \"n\"", "lowercase alias");
  expect_eq(grammar.wrap("users.name AS n"), "\"users\".\"name\" as \"n\"", "uppercase alias keyword");
  expect_eq(grammar.wrap("name   as   n"), "\"name\" as \"n\"", "whitespace runs around alias");
}

void test_wrap_doubles_embedded_quotes() {
  Grammar grammar = ansi_grammar();
  expect_eq(grammar.wrap_value("we\"ird"), "\"we\"\"ird\"", "quote doubled");
}

void test_default_dialect_leaves_identifiers_unquoted() {
  Grammar grammar;
  expect_eq(grammar.wrap("users.name as n"), "users.name as n", "no quoting by default");
  expect_eq(grammar.dialect().name(), "default", "default dialect name");
}

void test_wrap_expression_renders_verbatim() {
  Grammar grammar = ansi_grammar();
  expect_eq(grammar.wrap(sqlforge::raw("count(*) as total")), "count(*) as total", "raw expression");
}

void test_table_prefix_applies_to_tables_and_aliases() {
  GrammarOptions options;
  options.table_prefix = "app_";
  Grammar grammar = ansi_grammar(options);
  expect_eq(grammar.wrap_table("users"), "\"app_users\"", "prefixed table");
  expect_eq(grammar.wrap_table("users as u"), "\"app_users\" as \"app_u\"", "prefixed alias");
  expect_eq(grammar.wrap_table("main.users"), "\"main\".\"app_users\"", "schema-qualified table");
  expect_eq(grammar.wrap("users.id"), "\"app_users\".\"id\"", "qualified column uses table prefix");
}

void test_json_selector_decomposes_into_path_segments() {
  Grammar grammar = ansi_grammar();
  sqlforge::JsonSelector selector = grammar.decompose_json_selector("items.meta->tags[0][1]->name");
  expect_eq(selector.field, "\"items\".\"meta\"", "field wrapped");
  expect_eq(selector.path.size(), 2, "two path segments");
  if (selector.path.size() != 2) return;
  expect_eq(selector.path[0].key, "tags", "first key");
  expect_eq(selector.path[0].indices.size(), 2, "two array indices");
  expect_eq(selector.path[1].key, "name", "second key");
  expect_eq(grammar.wrap_json_path(selector), "'$.\"tags\"[0][1].\"name\"'", "rendered path");
}

void test_json_path_escapes_quotes_and_leading_index() {
  Grammar grammar = ansi_grammar();
  expect_eq(grammar.wrap_json_path(grammar.decompose_json_selector("meta->it's")), "'$.\"it''s\"'",
            "single quote doubled");
  expect_eq(grammar.wrap_json_path(grammar.decompose_json_selector("meta->[2]")), "'$[2]'",
            "path starting with an index has no dot");
}

void test_json_selector_is_unsupported_by_default() {
  Grammar grammar;
  std::string message;
  bool thrown = throws_as<sqlforge::UnsupportedOperation>([&] { grammar.wrap("meta->name"); }, &message);
  expect_true(thrown, "arrow syntax fails without JSON support");
  expect_eq(message, "This database engine does not support JSON operations.", "message names feature");
}

void test_quote_string_joins_lists() {
  Grammar grammar;
  expect_eq(grammar.quote_string("a"), "'a'", "single value");
  expect_eq(grammar.quote_string(std::vector<std::string>{"a", "b"}), "'a', 'b'", "list");
}

}  // namespace

void register_identifier_tests(std::vector<TestCase>& tests) {
  tests.push_back({"wrap_quotes_qualified_segments", test_wrap_quotes_qualified_segments});
  tests.push_back({"wrap_handles_aliases_case_insensitively", test_wrap_handles_aliases_case_insensitively});
  tests.push_back({"wrap_doubles_embedded_quotes", test_wrap_doubles_embedded_quotes});
  tests.push_back({"default_dialect_leaves_identifiers_unquoted", test_default_dialect_leaves_identifiers_unquoted});
  tests.push_back({"wrap_expression_renders_verbatim", test_wrap_expression_renders_verbatim});
  tests.push_back({"table_prefix_applies_to_tables_and_aliases", test_table_prefix_applies_to_tables_and_aliases});
  tests.push_back({"json_selector_decomposes_into_path_segments", test_json_selector_decomposes_into_path_segments});
  tests.push_back({"json_path_escapes_quotes_and_leading_index", test_json_path_escapes_quotes_and_leading_index});
  tests.push_back({"json_selector_is_unsupported_by_default", test_json_selector_is_unsupported_by_default});
  tests.push_back({"quote_string_joins_lists", test_quote_string_joins_lists});
}
