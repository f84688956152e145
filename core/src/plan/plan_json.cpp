#include "sqlforge/plan_json.h"

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <optional>

#include "sqlforge/dialect.h"
#include "sqlforge/errors.h"
#include "../util/string_util.h"

namespace sqlforge {

namespace {

using Json = nlohmann::ordered_json;

[[noreturn]] void fail(const std::string& path, const std::string& what) {
  throw PlanFormatError(path + ": " + what);
}

std::string child(const std::string& path, const std::string& key) {
  return path + "." + key;
}

std::string child(const std::string& path, size_t index) {
  return path + "[" + std::to_string(index) + "]";
}

const Json* find(const Json& node, const char* key) {
  auto it = node.find(key);
  return it == node.end() ? nullptr : &*it;
}

const Json& require(const Json& node, const char* key, const std::string& path) {
  const Json* found = find(node, key);
  if (found == nullptr) fail(path, std::string("missing '") + key + "'");
  return *found;
}

void require_object(const Json& node, const std::string& path) {
  if (!node.is_object()) fail(path, "expected an object");
}

const Json& require_array(const Json& node, const std::string& path) {
  if (!node.is_array()) fail(path, "expected an array");
  return node;
}

void reject_unknown_keys(const Json& node,
                         const std::string& path,
                         std::initializer_list<const char*> keys,
                         const char* what) {
  for (const auto& item : node.items()) {
    bool known = false;
    for (const char* key : keys) {
      if (item.key() == key) {
        known = true;
        break;
      }
    }
    if (!known) fail(child(path, item.key()), std::string("unknown ") + what + " field");
  }
}

std::string read_string(const Json& node, const std::string& path) {
  if (!node.is_string()) fail(path, "expected a string");
  return node.get<std::string>();
}

std::string string_field(const Json& node, const char* key, const std::string& path, const std::string& fallback) {
  const Json* found = find(node, key);
  return found == nullptr ? fallback : read_string(*found, child(path, key));
}

bool bool_field(const Json& node, const char* key, const std::string& path, bool fallback) {
  const Json* found = find(node, key);
  if (found == nullptr) return fallback;
  if (!found->is_boolean()) fail(child(path, key), "expected a boolean");
  return found->get<bool>();
}

int64_t read_integer(const Json& node, const std::string& path) {
  if (node.is_number_unsigned()) {
    if (node.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      fail(path, "integer out of range");
    }
    return static_cast<int64_t>(node.get<uint64_t>());
  }
  if (!node.is_number_integer()) fail(path, "expected an integer");
  return node.get<int64_t>();
}

std::optional<int64_t> optional_integer(const Json& node, const char* key, const std::string& path) {
  const Json* found = find(node, key);
  if (found == nullptr || found->is_null()) return std::nullopt;
  return read_integer(*found, child(path, key));
}

unsigned char hex_digit(char c, const std::string& path) {
  if (c >= '0' && c <= '9') return static_cast<unsigned char>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<unsigned char>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F') return static_cast<unsigned char>(c - 'A' + 10);
  fail(path, std::string("invalid hex digit '") + c + "'");
}

Blob read_hex(const std::string& hex, const std::string& path) {
  if (hex.size() % 2 != 0) fail(path, "hex blob must have an even number of digits");
  Blob blob;
  blob.bytes.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    blob.bytes.push_back(static_cast<unsigned char>(hex_digit(hex[i], path) << 4 | hex_digit(hex[i + 1], path)));
  }
  return blob;
}

Value read_value(const Json& node, const std::string& path) {
  if (node.is_null()) return Value();
  if (node.is_boolean()) return Value(node.get<bool>());
  if (node.is_number_integer()) return Value(read_integer(node, path));
  if (node.is_number_float()) return Value(node.get<double>());
  if (node.is_string()) return Value(node.get<std::string>());
  if (node.is_object()) {
    if (const Json* sql = find(node, "raw")) {
      return Value(raw(read_string(*sql, child(path, "raw"))));
    }
    if (const Json* hex = find(node, "hex")) {
      return Value(read_hex(read_string(*hex, child(path, "hex")), child(path, "hex")));
    }
  }
  fail(path, "expected a scalar, {\"raw\": ...} or {\"hex\": ...}");
}

std::vector<Value> read_values(const Json& node, const std::string& path) {
  std::vector<Value> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    out.push_back(read_value(array[i], child(path, i)));
  }
  return out;
}

Identifier read_identifier(const Json& node, const std::string& path) {
  if (node.is_string()) return node.get<std::string>();
  if (node.is_object()) {
    if (const Json* sql = find(node, "raw")) {
      return raw(read_string(*sql, child(path, "raw")));
    }
  }
  fail(path, "expected a name or {\"raw\": ...}");
}

std::vector<Identifier> read_identifiers(const Json& node, const std::string& path) {
  if (node.is_string()) return {node.get<std::string>()};
  std::vector<Identifier> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    out.push_back(read_identifier(array[i], child(path, i)));
  }
  return out;
}

std::vector<std::string> read_strings(const Json& node, const std::string& path) {
  if (node.is_string()) return {node.get<std::string>()};
  std::vector<std::string> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    out.push_back(read_string(array[i], child(path, i)));
  }
  return out;
}

QueryPlan read_plan(const Json& node, const std::string& path, const Dialect& dialect);

QueryPlanPtr read_query(const Json& node, const std::string& path, const Dialect& dialect) {
  return std::make_shared<const QueryPlan>(read_plan(require(node, "query", path), child(path, "query"), dialect));
}

std::string read_boolean(const Json& node, const std::string& path) {
  std::string boolean = util::to_lower(string_field(node, "boolean", path, "and"));
  if (boolean != "and" && boolean != "or") {
    fail(child(path, "boolean"), "expected 'and' or 'or', got '" + boolean + "'");
  }
  return boolean;
}

std::string read_operator(const Json& node, const std::string& path) {
  return string_field(node, "operator", path, "=");
}

Identifier column_of(const Json& node, const std::string& path) {
  return read_identifier(require(node, "column", path), child(path, "column"));
}

std::string json_column_of(const Json& node, const std::string& path) {
  return read_string(require(node, "column", path), child(path, "column"));
}

Value value_of(const Json& node, const std::string& path) {
  return read_value(require(node, "value", path), child(path, "value"));
}

std::vector<Value> values_of(const Json& node, const std::string& path) {
  return read_values(require(node, "values", path), child(path, "values"));
}

std::optional<where::DatePart::Part> date_part_for(const std::string& type) {
  if (type == "date") return where::DatePart::Part::Date;
  if (type == "time") return where::DatePart::Part::Time;
  if (type == "day") return where::DatePart::Part::Day;
  if (type == "month") return where::DatePart::Part::Month;
  if (type == "year") return where::DatePart::Part::Year;
  return std::nullopt;
}

PredicateBody read_predicate_body(const std::string& type,
                                  const Json& node,
                                  const std::string& path,
                                  const Dialect& dialect) {
  bool negate = bool_field(node, "negate", path, false);
  if (type == "raw") {
    return where::Raw{read_identifier(require(node, "sql", path), child(path, "sql"))};
  }
  if (type == "basic") {
    return where::Basic{column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "bitwise") {
    return where::Bitwise{column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "like") {
    return where::Like{column_of(node, path), value_of(node, path), negate,
                       bool_field(node, "case_sensitive", path, false)};
  }
  if (type == "in") return where::In{column_of(node, path), values_of(node, path)};
  if (type == "not_in") return where::NotIn{column_of(node, path), values_of(node, path)};
  if (type == "in_raw") return where::InRaw{column_of(node, path), values_of(node, path)};
  if (type == "not_in_raw") return where::NotInRaw{column_of(node, path), values_of(node, path)};
  if (type == "null") return where::Null{column_of(node, path)};
  if (type == "not_null") return where::NotNull{column_of(node, path)};
  if (type == "between") {
    return where::Between{column_of(node, path), values_of(node, path), negate};
  }
  if (type == "between_columns") {
    return where::BetweenColumns{column_of(node, path),
                                 read_identifiers(require(node, "bounds", path), child(path, "bounds")), negate};
  }
  if (type == "value_between") {
    return where::ValueBetween{value_of(node, path),
                               read_identifiers(require(node, "columns", path), child(path, "columns")), negate};
  }
  if (auto part = date_part_for(type)) {
    return where::DatePart{*part, column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "column") {
    return where::ColumnCompare{read_identifier(require(node, "first", path), child(path, "first")),
                                read_operator(node, path),
                                read_identifier(require(node, "second", path), child(path, "second"))};
  }
  if (type == "nested") return where::Nested{read_query(node, path, dialect)};
  if (type == "sub") {
    return where::Sub{column_of(node, path), read_operator(node, path), read_query(node, path, dialect)};
  }
  if (type == "exists") return where::Exists{read_query(node, path, dialect), negate};
  if (type == "row_values") {
    return where::RowValues{read_identifiers(require(node, "columns", path), child(path, "columns")),
                            read_operator(node, path), values_of(node, path)};
  }
  if (type == "json_boolean") {
    return where::JsonBoolean{json_column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "json_contains") {
    return where::JsonContains{json_column_of(node, path), value_of(node, path), negate};
  }
  if (type == "json_overlaps") {
    return where::JsonOverlaps{json_column_of(node, path), value_of(node, path), negate};
  }
  if (type == "json_contains_key") return where::JsonContainsKey{json_column_of(node, path), negate};
  if (type == "json_length") {
    return where::JsonLength{json_column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "fulltext") {
    where::FullText fulltext;
    fulltext.columns = read_strings(require(node, "columns", path), child(path, "columns"));
    fulltext.value = value_of(node, path);
    if (const Json* options = find(node, "options")) {
      require_object(*options, child(path, "options"));
      for (const auto& item : options->items()) {
        fulltext.options[item.key()] = read_string(item.value(), child(child(path, "options"), item.key()));
      }
    }
    return fulltext;
  }
  if (type == "expression") {
    return where::ExpressionPredicate{raw(read_string(require(node, "sql", path), child(path, "sql")))};
  }
  fail(child(path, "type"), "unknown predicate type '" + type + "'");
}

std::vector<Predicate> read_predicates(const Json& node, const std::string& path, const Dialect& dialect) {
  std::vector<Predicate> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    const std::string item_path = child(path, i);
    const Json& item = array[i];
    require_object(item, item_path);
    reject_unknown_keys(item, item_path,
                        {"type", "boolean", "negate", "column", "operator", "value", "values", "sql", "query",
                         "first", "second", "bounds", "columns", "case_sensitive", "options"},
                        "predicate");
    Predicate predicate;
    predicate.boolean = read_boolean(item, item_path);
    std::string type = read_string(require(item, "type", item_path), child(item_path, "type"));
    predicate.body = read_predicate_body(type, item, item_path, dialect);
    out.push_back(std::move(predicate));
  }
  return out;
}

HavingBody read_having_body(const std::string& type,
                            const Json& node,
                            const std::string& path,
                            const Dialect& dialect) {
  if (type == "raw") return having::Raw{read_string(require(node, "sql", path), child(path, "sql"))};
  if (type == "basic") {
    return having::Basic{column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "between") {
    return having::Between{column_of(node, path), values_of(node, path), bool_field(node, "negate", path, false)};
  }
  if (type == "null") return having::Null{column_of(node, path)};
  if (type == "not_null") return having::NotNull{column_of(node, path)};
  if (type == "bit") {
    return having::Bit{column_of(node, path), read_operator(node, path), value_of(node, path)};
  }
  if (type == "expression") {
    return having::ExpressionPredicate{raw(read_string(require(node, "sql", path), child(path, "sql")))};
  }
  if (type == "nested") return having::Nested{read_query(node, path, dialect)};
  fail(child(path, "type"), "unknown having type '" + type + "'");
}

std::vector<HavingPredicate> read_havings(const Json& node, const std::string& path, const Dialect& dialect) {
  std::vector<HavingPredicate> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    const std::string item_path = child(path, i);
    const Json& item = array[i];
    require_object(item, item_path);
    reject_unknown_keys(item, item_path,
                        {"type", "boolean", "negate", "column", "operator", "value", "values", "sql", "query"},
                        "having");
    HavingPredicate having;
    having.boolean = read_boolean(item, item_path);
    std::string type = read_string(require(item, "type", item_path), child(item_path, "type"));
    having.body = read_having_body(type, item, item_path, dialect);
    out.push_back(std::move(having));
  }
  return out;
}

std::vector<JoinSpec> read_joins(const Json& node, const std::string& path, const Dialect& dialect) {
  std::vector<JoinSpec> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    const std::string item_path = child(path, i);
    const Json& item = array[i];
    require_object(item, item_path);
    reject_unknown_keys(item, item_path, {"type", "table", "on", "joins", "lateral"}, "join");
    JoinSpec join;
    join.type = util::to_lower(string_field(item, "type", item_path, "inner"));
    join.table = read_identifier(require(item, "table", item_path), child(item_path, "table"));
    if (const Json* on = find(item, "on")) join.wheres = read_predicates(*on, child(item_path, "on"), dialect);
    if (const Json* nested = find(item, "joins")) join.joins = read_joins(*nested, child(item_path, "joins"), dialect);
    join.lateral = bool_field(item, "lateral", item_path, false);
    out.push_back(std::move(join));
  }
  return out;
}

std::vector<OrderSpec> read_orders(const Json& node, const std::string& path) {
  std::vector<OrderSpec> out;
  const Json& array = require_array(node, path);
  for (size_t i = 0; i < array.size(); ++i) {
    const std::string item_path = child(path, i);
    const Json& item = array[i];
    OrderSpec order;
    if (item.is_string()) {
      order.column = item.get<std::string>();
      out.push_back(std::move(order));
      continue;
    }
    require_object(item, item_path);
    reject_unknown_keys(item, item_path, {"column", "direction", "sql"}, "order");
    if (const Json* sql = find(item, "sql")) {
      order.sql = read_string(*sql, child(item_path, "sql"));
    } else {
      order.column = column_of(item, item_path);
      order.direction = util::to_lower(string_field(item, "direction", item_path, "asc"));
      if (order.direction != "asc" && order.direction != "desc") {
        fail(child(item_path, "direction"), "expected 'asc' or 'desc', got '" + order.direction + "'");
      }
    }
    out.push_back(std::move(order));
  }
  return out;
}

Bindings read_bindings(const Json& node, const std::string& path) {
  require_object(node, path);
  Bindings bindings;
  for (const auto& item : node.items()) {
    bool known = false;
    for (size_t g = 0; g < kBindingGroupCount; ++g) {
      BindingGroup group = static_cast<BindingGroup>(g);
      if (item.key() == binding_group_name(group)) {
        bindings[group] = read_values(item.value(), child(path, item.key()));
        known = true;
        break;
      }
    }
    if (!known) fail(child(path, item.key()), "unknown binding group");
  }
  return bindings;
}

Record read_record(const Json& node, const std::string& path) {
  require_object(node, path);
  Record record;
  for (const auto& item : node.items()) {
    record.emplace_back(item.key(), read_value(item.value(), child(path, item.key())));
  }
  return record;
}

/// Bindings come from an explicit `bindings` object when present, otherwise
/// they are derived with the dialect that will compile the plan.
QueryPlan read_plan(const Json& node, const std::string& path, const Dialect& dialect) {
  require_object(node, path);
  reject_unknown_keys(node, path,
                      {"aggregate", "columns", "distinct", "from", "index_hint", "joins", "wheres", "groups",
                       "havings", "orders", "limit", "offset", "group_limit", "unions", "union_orders",
                       "union_limit", "union_offset", "lock", "bindings", "values"},
                      "plan");

  QueryPlan plan;
  if (const Json* aggregate = find(node, "aggregate")) {
    const std::string aggregate_path = child(path, "aggregate");
    require_object(*aggregate, aggregate_path);
    reject_unknown_keys(*aggregate, aggregate_path, {"function", "columns"}, "aggregate");
    Aggregate out;
    out.function = read_string(require(*aggregate, "function", aggregate_path), child(aggregate_path, "function"));
    const Json* columns = find(*aggregate, "columns");
    out.columns = columns ? read_identifiers(*columns, child(aggregate_path, "columns"))
                          : std::vector<Identifier>{"*"};
    plan.aggregate = std::move(out);
  }
  if (const Json* columns = find(node, "columns")) {
    plan.columns = read_identifiers(*columns, child(path, "columns"));
  }
  if (const Json* distinct = find(node, "distinct")) {
    if (distinct->is_boolean()) {
      plan.distinct = distinct->get<bool>();
    } else {
      plan.distinct = read_identifiers(*distinct, child(path, "distinct"));
    }
  }
  if (const Json* from = find(node, "from")) plan.from = read_identifier(*from, child(path, "from"));
  if (const Json* hint = find(node, "index_hint")) {
    const std::string hint_path = child(path, "index_hint");
    require_object(*hint, hint_path);
    reject_unknown_keys(*hint, hint_path, {"type", "index"}, "index hint");
    plan.index_hint = IndexHint{read_string(require(*hint, "type", hint_path), child(hint_path, "type")),
                                read_string(require(*hint, "index", hint_path), child(hint_path, "index"))};
  }
  if (const Json* joins = find(node, "joins")) plan.joins = read_joins(*joins, child(path, "joins"), dialect);
  if (const Json* wheres = find(node, "wheres")) plan.wheres = read_predicates(*wheres, child(path, "wheres"), dialect);
  if (const Json* groups = find(node, "groups")) plan.groups = read_identifiers(*groups, child(path, "groups"));
  if (const Json* havings = find(node, "havings")) {
    plan.havings = read_havings(*havings, child(path, "havings"), dialect);
  }
  if (const Json* orders = find(node, "orders")) plan.orders = read_orders(*orders, child(path, "orders"));
  plan.limit = optional_integer(node, "limit", path);
  plan.offset = optional_integer(node, "offset", path);
  if (const Json* group_limit = find(node, "group_limit")) {
    const std::string limit_path = child(path, "group_limit");
    require_object(*group_limit, limit_path);
    reject_unknown_keys(*group_limit, limit_path, {"value", "column"}, "group limit");
    plan.group_limit =
        GroupLimit{read_integer(require(*group_limit, "value", limit_path), child(limit_path, "value")),
                   read_string(require(*group_limit, "column", limit_path), child(limit_path, "column"))};
  }
  if (const Json* unions = find(node, "unions")) {
    const std::string unions_path = child(path, "unions");
    const Json& array = require_array(*unions, unions_path);
    for (size_t i = 0; i < array.size(); ++i) {
      const std::string item_path = child(unions_path, i);
      require_object(array[i], item_path);
      reject_unknown_keys(array[i], item_path, {"query", "all"}, "union");
      plan.unions.push_back(
          UnionSpec{read_query(array[i], item_path, dialect), bool_field(array[i], "all", item_path, false)});
    }
  }
  if (const Json* orders = find(node, "union_orders")) {
    plan.union_orders = read_orders(*orders, child(path, "union_orders"));
  }
  plan.union_limit = optional_integer(node, "union_limit", path);
  plan.union_offset = optional_integer(node, "union_offset", path);
  if (const Json* lock = find(node, "lock")) {
    if (lock->is_boolean()) {
      plan.lock = std::variant<bool, std::string>(lock->get<bool>());
    } else {
      plan.lock = std::variant<bool, std::string>(read_string(*lock, child(path, "lock")));
    }
  }

  if (const Json* bindings = find(node, "bindings")) {
    plan.bindings = read_bindings(*bindings, child(path, "bindings"));
  } else {
    plan.bindings = derive_bindings(plan, dialect);
  }
  return plan;
}

}  // namespace

Value value_from_json(const nlohmann::ordered_json& node) {
  return read_value(node, "$");
}

QueryPlan plan_from_json(const nlohmann::ordered_json& node, const Dialect& dialect) {
  return read_plan(node, "$", dialect);
}

QueryPlan plan_from_json(const nlohmann::ordered_json& node) {
  return plan_from_json(node, Dialect());
}

PlanDocument parse_plan_document(const std::string& text) {
  return parse_plan_document(text, Dialect());
}

PlanDocument parse_plan_document(const std::string& text, const Dialect& dialect) {
  Json root;
  try {
    root = Json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw PlanFormatError(std::string("invalid JSON: ") + e.what());
  }

  PlanDocument document;
  document.plan = read_plan(root, "$", dialect);

  const Json* values = find(root, "values");
  if (values == nullptr || values->is_null()) return document;
  if (values->is_object()) {
    Record record = read_record(*values, "$.values");
    for (const auto& entry : record) {
      document.assignments.emplace_back(entry.first, entry.second);
    }
    document.records.push_back(std::move(record));
  } else if (values->is_array()) {
    for (size_t i = 0; i < values->size(); ++i) {
      document.records.push_back(read_record((*values)[i], child("$.values", i)));
    }
  } else {
    fail("$.values", "expected an object or an array of objects");
  }
  return document;
}

}  // namespace sqlforge
