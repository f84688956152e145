#include "sqlforge/value.h"

#include <type_traits>

#include "sqlforge/query_plan.h"
#include "../util/string_util.h"

namespace sqlforge {

ExpressionPtr raw(std::string sql) {
  return std::make_shared<RawExpression>(std::move(sql));
}

bool Value::operator==(const Value& other) const {
  if (storage_.index() != other.storage_.index()) return false;
  return std::visit(
      [&](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(other.storage_);
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return true;
        } else if constexpr (std::is_same_v<T, Blob>) {
          return lhs.bytes == rhs.bytes;
        } else {
          return lhs == rhs;
        }
      },
      storage_);
}

Value resolve_value(const AssignmentValue& value) {
  if (const auto* deferred = std::get_if<std::function<Value()>>(&value)) {
    return (*deferred)();
  }
  return std::get<Value>(value);
}

std::vector<Value> clean_bindings(const std::vector<Value>& values) {
  std::vector<Value> out;
  out.reserve(values.size());
  for (const auto& value : values) {
    if (!value.is_expression()) out.push_back(value);
  }
  return out;
}

std::string describe_value(const Value& value) {
  return std::visit(
      [](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
          return util::format_double(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, Blob>) {
          return "<blob " + std::to_string(v.bytes.size()) + " bytes>";
        } else {
          return "<expression>";
        }
      },
      value.storage());
}

const char* binding_group_name(BindingGroup group) {
  switch (group) {
    case BindingGroup::Select:
      return "select";
    case BindingGroup::From:
      return "from";
    case BindingGroup::Join:
      return "join";
    case BindingGroup::Where:
      return "where";
    case BindingGroup::GroupBy:
      return "groupBy";
    case BindingGroup::Having:
      return "having";
    case BindingGroup::Order:
      return "order";
    case BindingGroup::Union:
      return "union";
    case BindingGroup::UnionOrder:
      return "unionOrder";
  }
  return "unknown";
}

std::vector<Value> Bindings::flatten() const {
  return flatten_except({});
}

std::vector<Value> Bindings::flatten_except(std::initializer_list<BindingGroup> excluded) const {
  std::vector<Value> out;
  for (size_t i = 0; i < kBindingGroupCount; ++i) {
    bool skip = false;
    for (BindingGroup group : excluded) {
      if (static_cast<size_t>(group) == i) {
        skip = true;
        break;
      }
    }
    if (skip) continue;
    out.insert(out.end(), groups[i].begin(), groups[i].end());
  }
  return out;
}

}  // namespace sqlforge
