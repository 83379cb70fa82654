#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace diffbudget::core {

// Byte-oriented text helpers shared by the splitter, classifier and truncators.
// All functions are locale-independent: "whitespace" means ASCII space, \t, \n, \r, \f, \v.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// split_lines splits on '\n' only. A trailing newline yields a trailing empty element, so
// "a\nb\n" -> {"a", "b", ""} and "" -> {""}. Views point into `text`.
inline std::vector<std::string_view> split_lines(const std::string_view text) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (true) {
    const std::size_t nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

// strip removes leading and trailing ASCII whitespace.
inline std::string_view strip(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return input.substr(start, end - start);
}

inline bool is_blank(const std::string_view input) {
  return strip(input).empty();
}

inline std::size_t count_char(const std::string_view input, const char ch) {
  return static_cast<std::size_t>(std::count(input.begin(), input.end(), ch));
}

// join concatenates parts with `separator` between consecutive elements.
template <typename Range>
std::string join(const Range& parts, const std::string_view separator) {
  std::string out;
  bool first = true;
  for (const auto& part : parts) {
    if (!first) {
      out += separator;
    }
    out += part;
    first = false;
  }
  return out;
}

// strip_ansi removes ANSI escape sequences (CSI sequences and two-byte Fe escapes), leaving
// all other bytes untouched. An ESC that does not start a complete sequence is kept.
[[nodiscard]] std::string strip_ansi(std::string_view text);

}  // namespace diffbudget::core
