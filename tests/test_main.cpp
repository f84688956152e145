#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "test_harness.h"

void register_identifier_tests(std::vector<TestCase>& tests);
void register_parameter_tests(std::vector<TestCase>& tests);
void register_where_predicate_tests(std::vector<TestCase>& tests);
void register_having_tests(std::vector<TestCase>& tests);
void register_join_tests(std::vector<TestCase>& tests);
void register_select_tests(std::vector<TestCase>& tests);
void register_write_statement_tests(std::vector<TestCase>& tests);
void register_binding_tests(std::vector<TestCase>& tests);
void register_raw_sql_tests(std::vector<TestCase>& tests);
void register_dialect_override_tests(std::vector<TestCase>& tests);
void register_plan_json_tests(std::vector<TestCase>& tests);
void register_diagnostics_tests(std::vector<TestCase>& tests);
void register_cli_args_tests(std::vector<TestCase>& tests);

namespace {

std::unordered_set<std::string> parse_skip_list_from_env() {
  std::unordered_set<std::string> out;
  const char* raw = std::getenv("SQLFORGE_TEST_SKIP");
  if (!raw || !*raw) return out;
  std::istringstream iss(raw);
  std::string token;
  while (std::getline(iss, token, ',')) {
    size_t start = 0;
    while (start < token.size() && std::isspace(static_cast<unsigned char>(token[start]))) ++start;
    size_t end = token.size();
    while (end > start && std::isspace(static_cast<unsigned char>(token[end - 1]))) --end;
    if (end > start) out.insert(token.substr(start, end - start));
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests;
  tests.reserve(64);
  register_identifier_tests(tests);
  register_parameter_tests(tests);
  register_where_predicate_tests(tests);
  register_having_tests(tests);
  register_join_tests(tests);
  register_select_tests(tests);
  register_write_statement_tests(tests);
  register_binding_tests(tests);
  register_raw_sql_tests(tests);
  register_dialect_override_tests(tests);
  register_plan_json_tests(tests);
  register_diagnostics_tests(tests);
  register_cli_args_tests(tests);

  const auto skip_tests = parse_skip_list_from_env();

  if (argc > 1) {
    std::string target = argv[1];
    if (skip_tests.find(target) != skip_tests.end()) {
      std::cout << "SKIPPED: " << target << std::endl;
      return EXIT_SUCCESS;
    }
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  if (skip_tests.empty()) {
    return run_all_tests(tests);
  }

  std::vector<TestCase> filtered;
  filtered.reserve(tests.size());
  for (const auto& test : tests) {
    if (skip_tests.find(test.name) != skip_tests.end()) {
      std::cout << "SKIPPED: " << test.name << std::endl;
      continue;
    }
    filtered.push_back(test);
  }
  return run_all_tests(filtered);
}
