#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

#include <glog/logging.h>

#include "sqlforge/diagnostics.h"
#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "sqlforge/plan_json.h"
#include "sqlforge/version.h"
#include "cli_args.h"
#include "compile_runner.h"

using namespace sqlforge::cli;

namespace {

bool read_plan_text(const std::string& path, std::string& text) {
  if (path.empty() || path == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  text = buffer.str();
  return true;
}

void report_failure(const std::exception& error, const CliOptions& options) {
  std::vector<sqlforge::Diagnostic> diagnostics{sqlforge::diagnose_failure(error)};
  if (options.format == "json") {
    std::cout << sqlforge::render_diagnostics_json(diagnostics) << std::endl;
  } else {
    std::cerr << sqlforge::render_diagnostics_text(diagnostics);
  }
}

}  // namespace

/// Entry point: parses flags, reads the plan document and prints compiled statements.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = google::GLOG_WARNING;
  google::InitGoogleLogging(argv[0]);

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "sqlforge " << sqlforge::version_string() << std::endl;
    return 0;
  }
  if (options.verbose) {
    FLAGS_minloglevel = google::GLOG_INFO;
    FLAGS_v = 1;
  }

  std::string text;
  if (!read_plan_text(options.plan_path, text)) {
    std::cerr << "Failed to read plan document: " << (options.plan_path.empty() ? "<stdin>" : options.plan_path)
              << "\n";
    return 2;
  }

  try {
    sqlforge::GrammarOptions grammar_options;
    grammar_options.table_prefix = options.table_prefix;
    sqlforge::Grammar grammar(make_dialect(options.dialect), grammar_options);
    sqlforge::PlanDocument document = sqlforge::parse_plan_document(text, grammar.dialect());

    std::vector<sqlforge::CompiledQuery> compiled = compile_document(document, grammar, options.statement);
    if (options.format == "json") {
      std::cout << render_compiled_json(compiled, grammar, options.raw) << std::endl;
    } else {
      std::cout << render_compiled_text(compiled, grammar, options.raw);
    }
  } catch (const sqlforge::SqlforgeError& e) {
    VLOG(1) << "sqlforge: compilation failed: " << e.what();
    report_failure(e, options);
    return 1;
  } catch (const std::exception& e) {
    LOG(ERROR) << "sqlforge: unexpected failure: " << e.what();
    report_failure(e, options);
    return 1;
  }
  return 0;
}
