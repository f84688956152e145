#include "sqlforge/dialect.h"

#include <cstdio>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "sqlforge/errors.h"
#include "sqlforge/grammar.h"
#include "../util/string_util.h"

namespace sqlforge {

namespace {

[[noreturn]] void unsupported(const std::string& feature) {
  throw UnsupportedOperation("This database engine does not support " + feature + ".");
}

}  // namespace

std::string Dialect::quote_identifier(const std::string& segment) const {
  return segment;
}

std::string Dialect::wrap_json_selector(const Grammar&, const JsonSelector&) const {
  unsupported("JSON operations");
}

std::string Dialect::wrap_json_boolean_selector(const Grammar& grammar, const JsonSelector& selector) const {
  return wrap_json_selector(grammar, selector);
}

std::string Dialect::wrap_json_boolean_value(const std::string& value) const {
  return value;
}

std::string Dialect::compile_json_contains(const Grammar&, const std::string&, const std::string&) const {
  unsupported("JSON contains operations");
}

std::string Dialect::compile_json_overlaps(const Grammar&, const std::string&, const std::string&) const {
  unsupported("JSON overlaps operations");
}

std::string Dialect::compile_json_contains_key(const Grammar&, const std::string&) const {
  unsupported("JSON contains key operations");
}

std::string Dialect::compile_json_length(const Grammar&,
                                         const std::string&,
                                         const std::string&,
                                         const std::string&) const {
  unsupported("JSON length operations");
}

std::string Dialect::compile_json_value_cast(const std::string& value) const {
  return value;
}

std::string Dialect::prepare_binding_for_json_contains(const Value& value) const {
  if (value.is_string() && !util::is_valid_utf8(value.as_string())) {
    throw MalformedPlan("Strings with invalid UTF-8 byte sequences cannot be encoded as JSON.");
  }
  nlohmann::json encoded = std::visit(
      [](const auto& v) -> nlohmann::json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
          return v;
        } else {
          throw MalformedPlan("JSON contains bindings must be scalar values");
        }
      },
      value.storage());
  return encoded.dump();
}

std::string Dialect::compile_full_text(const Grammar&, const where::FullText&) const {
  unsupported("fulltext search operations");
}

std::string Dialect::compile_join_lateral(const Grammar&, const JoinSpec&, const std::string&) const {
  unsupported("lateral joins");
}

std::string Dialect::compile_case_sensitive_like(const Grammar&, const where::Like&) const {
  unsupported("case sensitive like operations");
}

std::string Dialect::compile_integer_list(const std::vector<Value>& values) const {
  std::vector<std::string> parts;
  parts.reserve(values.size());
  for (const auto& value : values) {
    if (!value.is_integer()) {
      throw MalformedPlan("Raw in-list values must be integers, got " + describe_value(value));
    }
    parts.push_back(std::to_string(value.as_integer()));
  }
  return util::join(parts, ", ");
}

std::string Dialect::compile_index_hint(const Grammar&, const QueryPlan&, const IndexHint&) const {
  return "";
}

std::string Dialect::compile_lock(const Grammar&,
                                  const QueryPlan&,
                                  const std::variant<bool, std::string>& lock) const {
  if (const auto* text = std::get_if<std::string>(&lock)) return *text;
  return "";
}

std::string Dialect::compile_upsert(const Grammar&,
                                    const QueryPlan&,
                                    const std::vector<Record>&,
                                    const std::vector<std::string>&,
                                    const std::vector<UpsertUpdate>&) const {
  unsupported("upserts");
}

std::string Dialect::compile_insert_or_ignore(const Grammar&,
                                              const QueryPlan&,
                                              const std::vector<Record>&) const {
  unsupported("inserting while ignoring errors");
}

std::string Dialect::compile_insert_or_ignore_using(const Grammar&,
                                                    const QueryPlan&,
                                                    const std::vector<std::string>&,
                                                    const std::string&) const {
  unsupported("inserting while ignoring errors");
}

std::string Dialect::compile_insert_get_id(const Grammar& grammar,
                                           const QueryPlan& plan,
                                           const std::vector<Record>& records,
                                           const std::optional<std::string>&) const {
  return grammar.compile_insert_sql(plan, records);
}

std::vector<std::string> Dialect::compile_truncate(const Grammar& grammar, const QueryPlan& plan) const {
  if (!plan.from.has_value()) {
    throw MalformedPlan("Truncate requires a table");
  }
  return {"truncate table " + grammar.wrap_table(*plan.from)};
}

std::string Dialect::compile_savepoint(const std::string& name) const {
  return "SAVEPOINT " + name;
}

std::string Dialect::compile_savepoint_rollback(const std::string& name) const {
  return "ROLLBACK TO SAVEPOINT " + name;
}

std::string Dialect::compile_random(const std::string&) const {
  return "RANDOM()";
}

std::string Dialect::escape(const Grammar& grammar, const Value& value, bool binary) const {
  return std::visit(
      [&](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return "null";
        } else if constexpr (std::is_same_v<T, Blob>) {
          return escape_binary(v);
        } else if constexpr (std::is_same_v<T, ExpressionPtr>) {
          return grammar.get_value(*v);
        } else if constexpr (std::is_same_v<T, bool>) {
          return escape_bool(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return util::format_double(v);
        } else {
          if (binary) {
            return escape_binary(Blob{std::vector<unsigned char>(v.begin(), v.end())});
          }
          if (v.find('\0') != std::string::npos) {
            throw MalformedPlan("Strings with null bytes cannot be escaped. Use the binary escape option.");
          }
          if (!util::is_valid_utf8(v)) {
            throw MalformedPlan("Strings with invalid UTF-8 byte sequences cannot be escaped.");
          }
          return escape_string(v);
        }
      },
      value.storage());
}

std::string Dialect::escape_string(const std::string& value) const {
  return "'" + util::replace_all(value, "'", "''") + "'";
}

std::string Dialect::escape_bool(bool value) const {
  return value ? "1" : "0";
}

std::string Dialect::escape_binary(const Blob&) const {
  throw UnsupportedOperation("The database connection does not support escaping binary values.");
}

AnsiDialect::AnsiDialect()
    : Dialect({"similar to", "not similar to"}, {"&", "|", "^", "<<", ">>"}) {}

std::string AnsiDialect::quote_identifier(const std::string& segment) const {
  return "\"" + util::replace_all(segment, "\"", "\"\"") + "\"";
}

std::string AnsiDialect::escape_binary(const Blob& value) const {
  std::string out = "X'";
  out.reserve(3 + value.bytes.size() * 2);
  char buf[3];
  for (unsigned char byte : value.bytes) {
    std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned int>(byte));
    out += buf;
  }
  out += "'";
  return out;
}

}  // namespace sqlforge
