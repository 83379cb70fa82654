#include "diffbudget/diff/section_splitter.h"

#include "diffbudget/diff/diff_section.h"

namespace diffbudget::diff {

namespace {

// Position of the next boundary at or after `from` that starts a line, or npos.
std::size_t find_boundary(const std::string_view text, std::size_t from) {
  while (true) {
    const std::size_t pos = text.find(kSectionBoundary, from);
    if (pos == std::string_view::npos || pos == 0 || text[pos - 1] == '\n') {
      return pos;
    }
    from = pos + 1;
  }
}

}  // namespace

std::vector<std::string> split_diff(const std::string_view diff_text) {
  std::vector<std::string> sections;
  if (diff_text.empty()) {
    return sections;
  }

  std::size_t start = 0;
  std::size_t next = find_boundary(diff_text, 0);

  // Preamble before the first boundary (or the whole input when there is none).
  if (next != 0) {
    const std::size_t end = next == std::string_view::npos ? diff_text.size() : next;
    sections.emplace_back(diff_text.substr(0, end));
    start = end;
  }

  while (start < diff_text.size()) {
    next = find_boundary(diff_text, start + kSectionBoundary.size());
    const std::size_t end = next == std::string_view::npos ? diff_text.size() : next;
    sections.emplace_back(diff_text.substr(start, end - start));
    start = end;
  }

  return sections;
}

}  // namespace diffbudget::diff
