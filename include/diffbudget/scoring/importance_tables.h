#pragma once

#include <cstddef>
#include <regex>
#include <span>
#include <string_view>
#include <vector>

namespace diffbudget::scoring {

struct WeightEntry {
  std::string_view key;
  double weight;
};

// Weights keyed by extension including the dot (".py").
[[nodiscard]] std::span<const WeightEntry> extension_weights();

// Weights keyed by well-known file names. Keys containing '/' match anywhere in the path;
// all other keys match within the file's base name. Checked before extension_weights().
[[nodiscard]] std::span<const WeightEntry> special_file_weights();

inline constexpr double kDefaultExtensionWeight = 1.0;

struct CodePattern {
  std::string_view name;
  std::regex regex;
  double multiplier;
};

// Ordered pattern table, compiled on first use. Patterns run against the content of added
// diff lines with the leading '+' removed.
[[nodiscard]] const std::vector<CodePattern>& code_patterns();

// Multiplier applied when no code pattern matches.
inline constexpr double kNoPatternPenalty = 0.9;

// Added lines longer than this are not run through the pattern table.
inline constexpr std::size_t kMaxPatternLineLength = 1000;

}  // namespace diffbudget::scoring
