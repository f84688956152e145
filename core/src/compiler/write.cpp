#include "sqlforge/grammar.h"

#include "sqlforge/errors.h"
#include "../util/string_util.h"

namespace sqlforge {

namespace {

const Identifier& require_table(const QueryPlan& plan, const char* statement) {
  if (!plan.from.has_value()) {
    throw MalformedPlan(std::string(statement) + " requires a table");
  }
  return *plan.from;
}

// Every record must name the same columns in the same order as the first one,
// since the column list is taken from it.
void require_uniform_records(const std::vector<Record>& records) {
  const Record& first = records.front();
  for (size_t i = 1; i < records.size(); ++i) {
    const Record& record = records[i];
    bool same = record.size() == first.size();
    for (size_t j = 0; same && j < record.size(); ++j) {
      same = record[j].first == first[j].first;
    }
    if (!same) {
      throw MalformedPlan("Insert record " + std::to_string(i + 1) +
                          " does not match the columns of the first record");
    }
  }
}

std::vector<Value> record_bindings(const std::vector<Record>& records) {
  std::vector<Value> out;
  for (const auto& record : records) {
    for (const auto& entry : record) {
      out.push_back(entry.second);
    }
  }
  return clean_bindings(out);
}

std::vector<Record> normalize_records(const std::vector<Record>& records) {
  if (records.size() == 1 && records.front().empty()) return {};
  return records;
}

}  // namespace

std::string Grammar::compile_insert_sql(const QueryPlan& plan, const std::vector<Record>& records) const {
  std::string table = wrap_table(require_table(plan, "Insert"));
  if (records.empty()) {
    return "insert into " + table + " default values";
  }
  require_uniform_records(records);

  std::vector<Identifier> columns;
  for (const auto& entry : records.front()) {
    columns.emplace_back(entry.first);
  }

  std::vector<std::string> parameters;
  parameters.reserve(records.size());
  for (const auto& record : records) {
    parameters.push_back("(" + parameterize(record) + ")");
  }
  return "insert into " + table + " (" + columnize(columns) + ") values " + util::join(parameters, ", ");
}

CompiledQuery Grammar::compile_insert(const QueryPlan& plan, const std::vector<Record>& records) const {
  std::vector<Record> batch = normalize_records(records);
  return CompiledQuery{compile_insert_sql(plan, batch), record_bindings(batch)};
}

CompiledQuery Grammar::compile_insert(const QueryPlan& plan, const Record& record) const {
  return compile_insert(plan, std::vector<Record>{record});
}

CompiledQuery Grammar::compile_insert_or_ignore(const QueryPlan& plan, const std::vector<Record>& records) const {
  std::vector<Record> batch = normalize_records(records);
  return CompiledQuery{dialect_->compile_insert_or_ignore(*this, plan, batch), record_bindings(batch)};
}

CompiledQuery Grammar::compile_insert_get_id(const QueryPlan& plan,
                                             const std::vector<Record>& records,
                                             const std::optional<std::string>& sequence) const {
  std::vector<Record> batch = normalize_records(records);
  return CompiledQuery{dialect_->compile_insert_get_id(*this, plan, batch, sequence), record_bindings(batch)};
}

CompiledQuery Grammar::compile_insert_using(const QueryPlan& plan,
                                            const std::vector<std::string>& columns,
                                            const CompiledQuery& source) const {
  std::string table = wrap_table(require_table(plan, "Insert"));
  CompiledQuery out;
  out.bindings = clean_bindings(source.bindings);
  if (columns.empty() || (columns.size() == 1 && columns.front() == "*")) {
    out.sql = "insert into " + table + " " + source.sql;
    return out;
  }
  std::vector<Identifier> identifiers(columns.begin(), columns.end());
  out.sql = "insert into " + table + " (" + columnize(identifiers) + ") " + source.sql;
  return out;
}

CompiledQuery Grammar::compile_insert_or_ignore_using(const QueryPlan& plan,
                                                      const std::vector<std::string>& columns,
                                                      const CompiledQuery& source) const {
  return CompiledQuery{dialect_->compile_insert_or_ignore_using(*this, plan, columns, source.sql),
                       clean_bindings(source.bindings)};
}

CompiledQuery Grammar::compile_upsert(const QueryPlan& plan,
                                      const std::vector<Record>& records,
                                      const std::vector<std::string>& unique_by,
                                      const std::vector<UpsertUpdate>& update) const {
  std::vector<Record> batch = normalize_records(records);
  CompiledQuery out;
  out.sql = dialect_->compile_upsert(*this, plan, batch, unique_by, update);
  out.bindings = record_bindings(batch);
  for (const auto& column : update) {
    if (column.value.has_value() && !column.value->is_expression()) {
      out.bindings.push_back(*column.value);
    }
  }
  return out;
}

std::string Grammar::compile_update_columns(const Assignments& values) const {
  std::vector<std::string> parts;
  parts.reserve(values.size());
  for (const auto& entry : values) {
    const auto* value = std::get_if<Value>(&entry.second);
    parts.push_back(wrap(entry.first) + " = " + (value ? parameter(*value) : std::string("?")));
  }
  return util::join(parts, ", ");
}

CompiledQuery Grammar::compile_update(const QueryPlan& plan, const Assignments& values) const {
  std::string table = wrap_table(require_table(plan, "Update"));
  std::string columns = compile_update_columns(values);
  std::string where = compile_wheres(plan);

  std::string sql;
  if (!plan.joins.empty()) {
    sql = "update " + table + " " + compile_joins(plan.joins) + " set " + columns + " " + where;
  } else {
    sql = "update " + table + " set " + columns + " " + where;
  }
  return CompiledQuery{util::trim_ws(sql), prepare_bindings_for_update(plan.bindings, values)};
}

CompiledQuery Grammar::compile_delete(const QueryPlan& plan) const {
  std::string table = wrap_table(require_table(plan, "Delete"));
  std::string where = compile_wheres(plan);

  std::string sql;
  if (!plan.joins.empty()) {
    std::string alias = util::split_alias(table).back();
    sql = "delete " + alias + " from " + table + " " + compile_joins(plan.joins) + " " + where;
  } else {
    sql = "delete from " + table + " " + where;
  }
  return CompiledQuery{util::trim_ws(sql), prepare_bindings_for_delete(plan.bindings)};
}

std::vector<CompiledQuery> Grammar::compile_truncate(const QueryPlan& plan) const {
  std::vector<CompiledQuery> out;
  for (auto& sql : dialect_->compile_truncate(*this, plan)) {
    out.push_back(CompiledQuery{std::move(sql), {}});
  }
  return out;
}

std::vector<Value> Grammar::prepare_bindings_for_update(const Bindings& bindings, const Assignments& values) const {
  std::vector<Value> out = bindings[BindingGroup::Join];
  for (const auto& entry : values) {
    out.push_back(resolve_value(entry.second));
  }
  std::vector<Value> rest = bindings.flatten_except({BindingGroup::Select, BindingGroup::Join});
  out.insert(out.end(), rest.begin(), rest.end());
  return clean_bindings(out);
}

std::vector<Value> Grammar::prepare_bindings_for_delete(const Bindings& bindings) const {
  return clean_bindings(bindings.flatten_except({BindingGroup::Select}));
}

std::string Grammar::prepare_binding_for_json_contains(const Value& value) const {
  return dialect_->prepare_binding_for_json_contains(value);
}

}  // namespace sqlforge
