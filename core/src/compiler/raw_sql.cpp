#include "sqlforge/grammar.h"

namespace sqlforge {

std::string Grammar::escape(const Value& value, bool binary) const {
  return dialect_->escape(*this, value, binary);
}

std::string Grammar::substitute_bindings_into_raw_sql(const std::string& sql,
                                                      const std::vector<Value>& bindings) const {
  std::vector<std::string> escaped;
  escaped.reserve(bindings.size());
  for (const auto& binding : bindings) {
    escaped.push_back(escape(binding));
  }

  std::string query;
  query.reserve(sql.size());
  size_t next_binding = 0;
  bool in_string_literal = false;

  for (size_t i = 0; i < sql.size(); ++i) {
    char c = sql[i];
    if (i + 1 < sql.size()) {
      char next = sql[i + 1];
      // Escaped quotes (\' and '') and the escaped placeholder ?? pass through untouched.
      if ((c == '\\' && next == '\'') || (c == '\'' && next == '\'') || (c == '?' && next == '?')) {
        query.push_back(c);
        query.push_back(next);
        ++i;
        continue;
      }
    }
    if (c == '\'') {
      query.push_back(c);
      in_string_literal = !in_string_literal;
    } else if (c == '?' && !in_string_literal) {
      if (next_binding < escaped.size()) {
        query += escaped[next_binding++];
      } else {
        query.push_back('?');
      }
    } else {
      query.push_back(c);
    }
  }
  return query;
}

}  // namespace sqlforge
