#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sqlforge/dialect.h"
#include "sqlforge/grammar.h"
#include "sqlforge/plan_json.h"

namespace sqlforge::cli {

/// Resolves a `--dialect` name. MUST throw for unknown names.
std::shared_ptr<const Dialect> make_dialect(const std::string& name);

/// Compiles a plan document as the requested statement kind.
/// Truncate may yield several statements; every other kind yields one.
std::vector<CompiledQuery> compile_document(const PlanDocument& document,
                                            const Grammar& grammar,
                                            const std::string& statement);

/// One statement per line followed by its binding list, or the substituted SQL when `raw`.
std::string render_compiled_text(const std::vector<CompiledQuery>& compiled, const Grammar& grammar, bool raw);
/// JSON array of `{"sql": ..., "bindings": [...]}` objects (`bindings` omitted when `raw`).
std::string render_compiled_json(const std::vector<CompiledQuery>& compiled, const Grammar& grammar, bool raw);

}  // namespace sqlforge::cli
