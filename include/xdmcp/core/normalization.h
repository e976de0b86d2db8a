#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace xdmcp::core {

// ASCII-only, locale-independent string helpers used by ranking and symbol matching.
// Non-ASCII bytes are compared as-is, so case folding applies to A-Z only.

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// contains_ascii_ci reports whether needle occurs in haystack ignoring ASCII case.
// An empty needle is contained in every string.
inline bool contains_ascii_ci(const std::string_view haystack, const std::string_view needle) {
  return normalize_ascii_lower(haystack).find(normalize_ascii_lower(needle)) != std::string::npos;
}

// equals_ascii_ci compares two strings ignoring ASCII case.
inline bool equals_ascii_ci(const std::string_view a, const std::string_view b) {
  return a.size() == b.size() && normalize_ascii_lower(a) == normalize_ascii_lower(b);
}

// last_path_component returns the text after the final '/', or the whole input.
inline std::string_view last_path_component(const std::string_view path) {
  const auto slash = path.rfind('/');
  if (slash == std::string_view::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  if (input.empty()) {
    return std::string{};
  }

  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// split_nonempty_lines splits on '\n' and drops empty lines (a trailing '\r' is removed).
inline std::vector<std::string> split_nonempty_lines(const std::string_view text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (!line.empty()) {
      lines.emplace_back(line);
    }
    start = end + 1;
  }
  return lines;
}

}  // namespace xdmcp::core
