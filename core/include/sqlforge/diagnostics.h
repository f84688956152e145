#pragma once

#include <exception>
#include <string>
#include <vector>

namespace sqlforge {

/// Classifies diagnostic urgency for text and JSON rendering.
/// MUST remain stable for outputs and tests.
enum class DiagnosticSeverity {
  Error,
  Warning,
  Note,
};

/// Structured compilation failure report.
/// MUST include a stable code and actionable help.
struct Diagnostic {
  DiagnosticSeverity severity = DiagnosticSeverity::Error;
  std::string code;
  std::string message;
  std::string help;
};

const char* severity_name(DiagnosticSeverity severity);

/// Maps a caught exception to a diagnostic.
/// Codes: SQLF001 unsupported operation, SQLF002 malformed plan,
/// SQLF003 plan document format, SQLF004 anything else.
/// MUST NOT throw.
Diagnostic diagnose_failure(const std::exception& error);

/// Renders diagnostics in a human-readable block format.
/// MUST be deterministic for stable golden tests.
std::string render_diagnostics_text(const std::vector<Diagnostic>& diagnostics);
/// Renders diagnostics as a JSON array with keys in a fixed order.
std::string render_diagnostics_json(const std::vector<Diagnostic>& diagnostics);
bool has_error_diagnostics(const std::vector<Diagnostic>& diagnostics);

}  // namespace sqlforge
