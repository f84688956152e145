#include "cli_args.h"

#include <initializer_list>
#include <string>
#include <utility>

namespace sqlforge::cli {

namespace {

bool is_one_of(const std::string& value, std::initializer_list<const char*> choices) {
  for (const char* choice : choices) {
    if (value == choice) return true;
  }
  return false;
}

}  // namespace

/// Prints the help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os) {
  os << "sqlforge - compile JSON query plans into SQL and bindings\n\n";
  os << "Usage: sqlforge [--plan <path>] [--statement <kind>] [--dialect default|ansi]\n";
  os << "                [--table-prefix <prefix>] [--raw] [--format text|json] [--verbose]\n";
  os << "       sqlforge --help\n";
  os << "       sqlforge --version\n\n";
  os << "Statements: select, exists, insert, update, delete, truncate.\n";
  os << "If --plan is omitted or `-`, the plan document is read from stdin.\n";
  os << "Write statements take their payload from the document's `values` field.\n";
  os << "--raw substitutes escaped bindings into the SQL instead of listing them.\n";
  os << "--format json emits statements and diagnostics as JSON.\n";
  os << "Exit codes: 0=success, 1=compilation error, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto take_value = [&](std::string& target) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      target = argv[++i];
      return true;
    };

    if (arg == "--plan") {
      if (!take_value(parsed.plan_path)) return false;
    } else if (arg == "--statement") {
      if (!take_value(parsed.statement)) return false;
      if (!is_one_of(parsed.statement, {"select", "exists", "insert", "update", "delete", "truncate"})) {
        error = "Invalid --statement value (use select|exists|insert|update|delete|truncate)";
        return false;
      }
    } else if (arg == "--dialect") {
      if (!take_value(parsed.dialect)) return false;
      if (!is_one_of(parsed.dialect, {"default", "ansi"})) {
        error = "Invalid --dialect value (use default|ansi)";
        return false;
      }
    } else if (arg == "--table-prefix") {
      if (!take_value(parsed.table_prefix)) return false;
    } else if (arg == "--format") {
      if (!take_value(parsed.format)) return false;
      if (!is_one_of(parsed.format, {"text", "json"})) {
        error = "Invalid --format value (use text|json)";
        return false;
      }
    } else if (arg == "--raw") {
      parsed.raw = true;
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  options = std::move(parsed);
  return true;
}

}  // namespace sqlforge::cli
