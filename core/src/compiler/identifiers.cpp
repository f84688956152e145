#include "sqlforge/grammar.h"

#include "../util/string_util.h"

namespace sqlforge {

namespace {

// Splits a trailing run of `[..]` groups off a path segment: `tags[0][1]`
// yields key `tags` and indices `0`, `1`.
JsonPathSegment parse_json_path_segment(const std::string& segment) {
  JsonPathSegment out;
  size_t end = segment.size();
  std::vector<std::string> reversed;
  while (end > 0 && segment[end - 1] == ']') {
    size_t open = segment.rfind('[', end - 1);
    if (open == std::string::npos || open + 1 >= end - 1) break;
    reversed.push_back(segment.substr(open + 1, end - open - 2));
    end = open;
  }
  out.key = segment.substr(0, end);
  out.indices.assign(reversed.rbegin(), reversed.rend());
  return out;
}

// Runs of backslashes before a quote collapse into a doubled quote.
std::string escape_json_path_quotes(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    size_t j = i;
    while (j < value.size() && value[j] == '\\') ++j;
    if (j < value.size() && value[j] == '\'') {
      out += "''";
      i = j + 1;
      continue;
    }
    out.append(value, i, j - i);
    if (j < value.size()) out.push_back(value[j]);
    i = j + 1;
  }
  return out;
}

}  // namespace

Grammar::Grammar(std::shared_ptr<const Dialect> dialect, GrammarOptions options)
    : dialect_(dialect ? std::move(dialect) : std::make_shared<const Dialect>()),
      options_(std::move(options)) {}

std::string Grammar::wrap(const Identifier& value) const {
  if (const auto* expression = std::get_if<ExpressionPtr>(&value)) {
    return get_value(**expression);
  }
  return wrap_name(std::get<std::string>(value));
}

std::string Grammar::wrap_name(const std::string& value) const {
  if (util::split_alias(value).size() > 1) {
    return wrap_aliased_value(value);
  }
  if (is_json_selector(value)) {
    return wrap_json_selector(value);
  }
  return wrap_segments(util::split(value, '.'));
}

std::string Grammar::wrap_aliased_value(const std::string& value) const {
  std::vector<std::string> segments = util::split_alias(value);
  return wrap_name(segments[0]) + " as " + wrap_value(segments[1]);
}

std::string Grammar::wrap_segments(const std::vector<std::string>& segments) const {
  std::vector<std::string> wrapped;
  wrapped.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i == 0 && segments.size() > 1) {
      wrapped.push_back(wrap_table_name(segments[i]));
    } else {
      wrapped.push_back(wrap_value(segments[i]));
    }
  }
  return util::join(wrapped, ".");
}

std::string Grammar::wrap_table(const Identifier& table) const {
  if (const auto* expression = std::get_if<ExpressionPtr>(&table)) {
    return get_value(**expression);
  }
  return wrap_table_name(std::get<std::string>(table));
}

std::string Grammar::wrap_table_name(const std::string& table) const {
  if (util::split_alias(table).size() > 1) {
    return wrap_aliased_table(table);
  }
  const std::string& prefix = options_.table_prefix;
  size_t last_dot = table.rfind('.');
  if (last_dot != std::string::npos) {
    std::string prefixed = table.substr(0, last_dot) + "." + prefix + table.substr(last_dot + 1);
    std::vector<std::string> wrapped;
    for (const auto& segment : util::split(prefixed, '.')) {
      wrapped.push_back(wrap_value(segment));
    }
    return util::join(wrapped, ".");
  }
  return wrap_value(prefix + table);
}

std::string Grammar::wrap_aliased_table(const std::string& value) const {
  std::vector<std::string> segments = util::split_alias(value);
  return wrap_table_name(segments[0]) + " as " + wrap_value(options_.table_prefix + segments[1]);
}

std::string Grammar::wrap_value(const std::string& segment) const {
  if (segment == "*") return segment;
  return dialect_->quote_identifier(segment);
}

std::vector<std::string> Grammar::wrap_array(const std::vector<Identifier>& values) const {
  std::vector<std::string> out;
  out.reserve(values.size());
  for (const auto& value : values) {
    out.push_back(wrap(value));
  }
  return out;
}

bool Grammar::is_json_selector(const std::string& value) const {
  return value.find("->") != std::string::npos;
}

JsonSelector Grammar::decompose_json_selector(const std::string& value) const {
  JsonSelector selector;
  size_t arrow = value.find("->");
  if (arrow == std::string::npos) {
    selector.field = wrap_segments(util::split(value, '.'));
    return selector;
  }
  selector.field = wrap_segments(util::split(value.substr(0, arrow), '.'));
  std::string rest = value.substr(arrow + 2);
  size_t start = 0;
  while (true) {
    size_t pos = rest.find("->", start);
    std::string segment = rest.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
    selector.path.push_back(parse_json_path_segment(segment));
    if (pos == std::string::npos) break;
    start = pos + 2;
  }
  return selector;
}

std::string Grammar::wrap_json_path(const JsonSelector& selector) const {
  std::vector<std::string> rendered;
  rendered.reserve(selector.path.size());
  for (const auto& segment : selector.path) {
    std::string text;
    if (!segment.key.empty()) {
      text = "\"" + escape_json_path_quotes(segment.key) + "\"";
    }
    for (const auto& index : segment.indices) {
      text += "[" + escape_json_path_quotes(index) + "]";
    }
    rendered.push_back(text);
  }
  std::string path = util::join(rendered, ".");
  bool starts_with_index = !path.empty() && path[0] == '[';
  return "'$" + std::string(starts_with_index ? "" : ".") + path + "'";
}

std::string Grammar::wrap_json_selector(const std::string& value) const {
  return dialect_->wrap_json_selector(*this, decompose_json_selector(value));
}

std::string Grammar::parameter(const Value& value) const {
  if (value.is_expression()) return get_value(*value.expression());
  return "?";
}

std::string Grammar::parameterize(const std::vector<Value>& values) const {
  std::vector<std::string> parts;
  parts.reserve(values.size());
  for (const auto& value : values) {
    parts.push_back(parameter(value));
  }
  return util::join(parts, ", ");
}

std::string Grammar::parameterize(const Record& record) const {
  std::vector<std::string> parts;
  parts.reserve(record.size());
  for (const auto& entry : record) {
    parts.push_back(parameter(entry.second));
  }
  return util::join(parts, ", ");
}

std::string Grammar::columnize(const std::vector<Identifier>& columns) const {
  return util::join(wrap_array(columns), ", ");
}

std::string Grammar::quote_string(const std::string& value) const {
  return "'" + value + "'";
}

std::string Grammar::quote_string(const std::vector<std::string>& values) const {
  std::vector<std::string> parts;
  parts.reserve(values.size());
  for (const auto& value : values) {
    parts.push_back(quote_string(value));
  }
  return util::join(parts, ", ");
}

std::string Grammar::get_value(const Expression& expression) const {
  return expression.value(*this);
}

}  // namespace sqlforge
