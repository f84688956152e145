#pragma once

#include <ostream>
#include <string>

namespace sqlforge::cli {

struct CliOptions {
  /// Plan document path; empty or `-` reads stdin.
  std::string plan_path;
  std::string statement = "select";
  std::string dialect = "default";
  std::string table_prefix;
  bool raw = false;
  std::string format = "text";
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
};

void print_help(std::ostream& os);
/// Parses argv into typed options.
/// MUST return false with a message for unknown flags, missing values and invalid choices.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace sqlforge::cli
