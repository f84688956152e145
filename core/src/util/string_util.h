#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sqlforge::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep compilation deterministic.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
std::string trim_ws(const std::string& s);
/// Trims leading ASCII whitespace only.
std::string ltrim_ws(const std::string& s);
std::string join(const std::vector<std::string>& parts, std::string_view separator);
std::vector<std::string> split(const std::string& s, char delimiter);
std::string replace_all(std::string s, std::string_view from, std::string_view to);
/// Splits around a case-insensitive ` as ` keyword surrounded by whitespace runs.
/// Returns the input unchanged as a single element when no alias is present.
std::vector<std::string> split_alias(const std::string& s);
/// Removes the first `and ` / `or ` occurrence, case-insensitively.
std::string remove_leading_boolean(const std::string& s);
/// Removes an exact keyword prefix; throws MalformedPlan when it is missing.
std::string strip_known_prefix(const std::string& s, std::string_view prefix);
bool is_valid_utf8(std::string_view s);
/// Shortest decimal text that round-trips the double.
std::string format_double(double value);

}  // namespace sqlforge::util
