#include "compile_runner.h"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <glog/logging.h>
#include <nlohmann/json.hpp>

#include "sqlforge/errors.h"

namespace sqlforge::cli {

namespace {

nlohmann::ordered_json binding_to_json(const Value& value) {
  return std::visit(
      [](const auto& v) -> nlohmann::ordered_json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, Blob>) {
          std::string hex = "0x";
          char buf[3];
          for (unsigned char byte : v.bytes) {
            std::snprintf(buf, sizeof(buf), "%02x", static_cast<unsigned int>(byte));
            hex += buf;
          }
          return hex;
        } else if constexpr (std::is_same_v<T, ExpressionPtr>) {
          return nullptr;
        } else {
          return v;
        }
      },
      value.storage());
}

std::string describe_bindings(const std::vector<Value>& bindings) {
  std::string out = "[";
  for (size_t i = 0; i < bindings.size(); ++i) {
    if (i != 0) out += ", ";
    out += describe_value(bindings[i]);
  }
  return out + "]";
}

}  // namespace

std::shared_ptr<const Dialect> make_dialect(const std::string& name) {
  if (name == "default") return std::make_shared<const Dialect>();
  if (name == "ansi") return std::make_shared<const AnsiDialect>();
  throw std::invalid_argument("Unknown dialect: " + name);
}

std::vector<CompiledQuery> compile_document(const PlanDocument& document,
                                            const Grammar& grammar,
                                            const std::string& statement) {
  VLOG(1) << "sqlforge: compiling " << statement << " statement with the " << grammar.dialect().name()
          << " dialect";
  const QueryPlan& plan = document.plan;
  if (statement == "select") return {grammar.compile_select(plan)};
  if (statement == "exists") return {grammar.compile_exists(plan)};
  if (statement == "insert") return {grammar.compile_insert(plan, document.records)};
  if (statement == "update") {
    if (document.assignments.empty()) {
      throw PlanFormatError("$.values: update requires an object of column assignments");
    }
    return {grammar.compile_update(plan, document.assignments)};
  }
  if (statement == "delete") return {grammar.compile_delete(plan)};
  if (statement == "truncate") return grammar.compile_truncate(plan);
  throw std::invalid_argument("Unknown statement kind: " + statement);
}

std::string render_compiled_text(const std::vector<CompiledQuery>& compiled, const Grammar& grammar, bool raw) {
  std::ostringstream out;
  for (const auto& query : compiled) {
    if (raw) {
      out << grammar.substitute_bindings_into_raw_sql(query.sql, query.bindings) << "\n";
      continue;
    }
    out << query.sql << "\n";
    out << "bindings: " << describe_bindings(query.bindings) << "\n";
  }
  return out.str();
}

std::string render_compiled_json(const std::vector<CompiledQuery>& compiled, const Grammar& grammar, bool raw) {
  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& query : compiled) {
    nlohmann::ordered_json item;
    if (raw) {
      item["sql"] = grammar.substitute_bindings_into_raw_sql(query.sql, query.bindings);
    } else {
      item["sql"] = query.sql;
      nlohmann::ordered_json bindings = nlohmann::ordered_json::array();
      for (const auto& binding : query.bindings) {
        bindings.push_back(binding_to_json(binding));
      }
      item["bindings"] = std::move(bindings);
    }
    out.push_back(std::move(item));
  }
  return out.dump();
}

}  // namespace sqlforge::cli
