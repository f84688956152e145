#include "string_util.h"

#include <cctype>
#include <charconv>
#include <cstddef>
#include <system_error>

#include "sqlforge/errors.h"

namespace sqlforge::util {

namespace {

bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

char lower_ascii(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

size_t find_icase(std::string_view haystack, std::string_view needle, size_t from = 0) {
  if (needle.empty()) return from <= haystack.size() ? from : std::string_view::npos;
  if (haystack.size() < needle.size()) return std::string_view::npos;
  for (size_t i = from; i + needle.size() <= haystack.size(); ++i) {
    bool match = true;
    for (size_t j = 0; j < needle.size(); ++j) {
      if (lower_ascii(haystack[i + j]) != lower_ascii(needle[j])) {
        match = false;
        break;
      }
    }
    if (match) return i;
  }
  return std::string_view::npos;
}

}  // namespace

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = lower_ascii(c);
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && is_space(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && is_space(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::string ltrim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && is_space(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  return s.substr(start);
}

std::string join(const std::vector<std::string>& parts, std::string_view separator) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out.append(separator);
    out += parts[i];
  }
  return out;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(delimiter, start);
    if (pos == std::string::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

std::string replace_all(std::string s, std::string_view from, std::string_view to) {
  if (from.empty()) return s;
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
  return s;
}

std::vector<std::string> split_alias(const std::string& s) {
  // Mirrors /\s+as\s+/i: at least one whitespace on each side of the keyword.
  for (size_t i = 1; i + 3 < s.size(); ++i) {
    if (!is_space(static_cast<unsigned char>(s[i - 1]))) continue;
    if (lower_ascii(s[i]) != 'a' || lower_ascii(s[i + 1]) != 's') continue;
    if (!is_space(static_cast<unsigned char>(s[i + 2]))) continue;
    size_t left = i - 1;
    while (left > 0 && is_space(static_cast<unsigned char>(s[left - 1]))) --left;
    size_t right = i + 2;
    while (right < s.size() && is_space(static_cast<unsigned char>(s[right]))) ++right;
    std::vector<std::string> out;
    out.push_back(s.substr(0, left));
    std::vector<std::string> rest = split_alias(s.substr(right));
    out.insert(out.end(), rest.begin(), rest.end());
    return out;
  }
  return {s};
}

std::string remove_leading_boolean(const std::string& s) {
  size_t and_pos = find_icase(s, "and ");
  size_t or_pos = find_icase(s, "or ");
  if (and_pos == std::string_view::npos && or_pos == std::string_view::npos) return s;
  std::string out = s;
  if (or_pos == std::string_view::npos || (and_pos != std::string_view::npos && and_pos < or_pos)) {
    out.erase(and_pos, 4);
  } else {
    out.erase(or_pos, 3);
  }
  return out;
}

std::string strip_known_prefix(const std::string& s, std::string_view prefix) {
  if (s.compare(0, prefix.size(), prefix) != 0) {
    throw MalformedPlan("Expected compiled clause to start with '" + std::string(prefix) +
                        "' but got '" + s + "'");
  }
  return s.substr(prefix.size());
}

bool is_valid_utf8(std::string_view s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t extra = 0;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      if (c < 0xC2) return false;
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((c & 0xF8) == 0xF0) {
      if (c > 0xF4) return false;
      extra = 3;
    } else {
      return false;
    }
    if (i + extra >= s.size()) return false;
    for (size_t j = 1; j <= extra; ++j) {
      unsigned char cc = static_cast<unsigned char>(s[i + j]);
      if ((cc & 0xC0) != 0x80) return false;
    }
    i += extra + 1;
  }
  return true;
}

std::string format_double(double value) {
  char buf[64];
  auto result = std::to_chars(buf, buf + sizeof(buf), value);
  if (result.ec != std::errc()) return std::to_string(value);
  return std::string(buf, result.ptr);
}

}  // namespace sqlforge::util
