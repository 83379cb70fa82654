#pragma once

#include "diffbudget/diff/diff_section.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace diffbudget::scoring {

// ScoreBreakdown lists every factor that went into a section's score.
struct ScoreBreakdown {
  double extension_factor = 1.0;
  double change_kind_factor = 1.0;
  double volume_factor = 1.0;
  double pattern_factor = 1.0;
  std::vector<std::string> matched_patterns;

  [[nodiscard]] double total() const {
    return extension_factor * change_kind_factor * volume_factor * pattern_factor;
  }
};

// ScoredSection pairs a parsed section with its (strictly positive) importance score.
struct ScoredSection {
  diff::DiffSection section;
  double score = 1.0;
};

/// Importance weight for a file path: special file names first, then the extension table,
/// otherwise kDefaultExtensionWeight.
[[nodiscard]] double extension_score(std::string_view file_path);

/// Product of the multipliers of every code pattern found on added lines, or
/// kNoPatternPenalty when none matches. Regex failures count as no match.
[[nodiscard]] double code_pattern_score(std::string_view section_text,
                                        std::vector<std::string>* matched = nullptr);

/// 1.0 + min(1.0, 0.1 * changes / 5).
[[nodiscard]] double volume_factor(std::size_t total_changes);

[[nodiscard]] double change_kind_factor(diff::ChangeKind kind);

[[nodiscard]] ScoreBreakdown score_breakdown(const diff::DiffSection& section);

/// Parse and score raw section text.
[[nodiscard]] double score(std::string_view section_text);

/// Parse and score each section, preserving input order.
[[nodiscard]] std::vector<ScoredSection> score_sections(std::vector<std::string> sections);

}  // namespace diffbudget::scoring
