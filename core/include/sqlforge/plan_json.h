#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "sqlforge/dialect.h"
#include "sqlforge/query_plan.h"
#include "sqlforge/value.h"

namespace sqlforge {

/// A plan document: the read plan plus the optional write payload under `values`.
struct PlanDocument {
  QueryPlan plan;
  /// Insert payload; an object becomes one record, an array one record per element.
  std::vector<Record> records;
  /// Update payload; set only when `values` is an object.
  Assignments assignments;
};

/// Maps a JSON scalar onto a Value. `{"raw": "..."}` yields an expression and
/// `{"hex": "..."}` a blob. MUST throw PlanFormatError on anything else.
Value value_from_json(const nlohmann::ordered_json& node);

/// Builds a plan from a JSON object. Predicates are tagged by `type`
/// (`basic`, `in`, `nested`, `json_contains`, ...). Bindings are derived from
/// the predicates, with `dialect` encoding JSON document values, unless the
/// document supplies a `bindings` object. Unknown keys in the plan or any of
/// its nested objects are rejected.
QueryPlan plan_from_json(const nlohmann::ordered_json& node, const Dialect& dialect);
QueryPlan plan_from_json(const nlohmann::ordered_json& node);

/// Parses a whole plan document from text.
/// MUST throw PlanFormatError for malformed JSON or unknown layout.
PlanDocument parse_plan_document(const std::string& text, const Dialect& dialect);
PlanDocument parse_plan_document(const std::string& text);

}  // namespace sqlforge
