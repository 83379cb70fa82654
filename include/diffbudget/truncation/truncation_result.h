#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace diffbudget::truncation {

// Name used for sections without an extractable path in summaries and reports.
inline constexpr const char* kUnknownPath = "(unknown)";

// TruncationResult is the budget truncator's output plus the bookkeeping behind it.
// render() is the text handed to the prompt; token_count is the exact count of render().
struct TruncationResult {
  std::vector<std::string> included_texts;  // append order (score descending)
  std::vector<std::string> included_paths;  // parallel to included_texts
  std::vector<std::string> skipped_paths;   // walk order
  std::optional<std::string> skipped_summary;
  std::optional<std::string> usage_summary;
  std::size_t total_sections = 0;
  int section_tokens = 0;  // running total over included sections
  int token_count = 0;
  bool truncated_section = false;
  bool fast_path = false;

  [[nodiscard]] std::string render() const;
};

// Joins section texts and summary lines. Each summary line starts on its own line and is
// newline-terminated.
[[nodiscard]] std::string render_truncation(const std::vector<std::string>& included_texts,
                                            const std::optional<std::string>& skipped_summary,
                                            const std::optional<std::string>& usage_summary);

}  // namespace diffbudget::truncation
