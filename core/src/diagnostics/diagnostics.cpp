#include "sqlforge/diagnostics.h"

#include <sstream>

#include <nlohmann/json.hpp>

#include "sqlforge/errors.h"

namespace sqlforge {

namespace {

constexpr const char* kUnsupportedCode = "SQLF001";
constexpr const char* kMalformedCode = "SQLF002";
constexpr const char* kPlanFormatCode = "SQLF003";
constexpr const char* kInternalCode = "SQLF004";

}  // namespace

const char* severity_name(DiagnosticSeverity severity) {
  switch (severity) {
    case DiagnosticSeverity::Error:
      return "ERROR";
    case DiagnosticSeverity::Warning:
      return "WARNING";
    case DiagnosticSeverity::Note:
      return "NOTE";
  }
  return "ERROR";
}

Diagnostic diagnose_failure(const std::exception& error) {
  Diagnostic d;
  d.severity = DiagnosticSeverity::Error;
  d.message = error.what();
  if (dynamic_cast<const UnsupportedOperation*>(&error) != nullptr) {
    d.code = kUnsupportedCode;
    d.help = "Use a dialect that implements this feature, or rewrite the query without it.";
  } else if (dynamic_cast<const MalformedPlan*>(&error) != nullptr) {
    d.code = kMalformedCode;
    d.help = "The query plan is structurally invalid; fix the plan before compiling it.";
  } else if (dynamic_cast<const PlanFormatError*>(&error) != nullptr) {
    d.code = kPlanFormatCode;
    d.help = "Check the plan document against the expected JSON layout.";
  } else {
    d.code = kInternalCode;
    d.help = "Unexpected failure while compiling; re-run with --verbose for details.";
  }
  return d;
}

std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics) {
  std::ostringstream out;
  for (size_t i = 0; i < diagnostics.size(); ++i) {
    const auto& d = diagnostics[i];
    out << severity_name(d.severity) << "[" << d.code << "]: " << d.message << "\n";
    out << "help: " << d.help << "\n";
    if (i + 1 < diagnostics.size()) out << "\n";
  }
  return out.str();
}

std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& d : diagnostics) {
    nlohmann::ordered_json item;
    item["severity"] = severity_name(d.severity);
    item["code"] = d.code;
    item["message"] = d.message;
    item["help"] = d.help;
    out.push_back(std::move(item));
  }
  return out.dump();
}

bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics) {
  for (const auto& d : diagnostics) {
    if (d.severity == DiagnosticSeverity::Error) return true;
  }
  return false;
}

}  // namespace sqlforge
