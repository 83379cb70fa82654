#include "diffbudget/scoring/importance_scorer.h"

#include "diffbudget/core/text.h"
#include "diffbudget/scoring/importance_tables.h"

#include <algorithm>
#include <regex>
#include <utility>

namespace diffbudget::scoring {

namespace {

std::string_view base_name(const std::string_view path) {
  const std::size_t slash = path.rfind('/');
  return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// Extension including the dot, or "" when there is none. Leading dots belong to the name,
// so ".gitignore" has no extension.
std::string_view extension_of(const std::string_view name) {
  const std::size_t dot = name.rfind('.');
  const std::size_t first_non_dot = name.find_first_not_of('.');
  if (dot == std::string_view::npos || first_non_dot == std::string_view::npos ||
      dot < first_non_dot) {
    return {};
  }
  return name.substr(dot);
}

bool line_matches(const std::regex& pattern, const std::string& line) {
  try {
    return std::regex_search(line, pattern);
  } catch (const std::regex_error&) {
    return false;
  }
}

}  // namespace

double extension_score(const std::string_view file_path) {
  const std::string_view name = base_name(file_path);

  for (const auto& entry : special_file_weights()) {
    const bool path_key = entry.key.find('/') != std::string_view::npos;
    const std::string_view haystack = path_key ? file_path : name;
    if (haystack.find(entry.key) != std::string_view::npos) {
      return entry.weight;
    }
  }

  const std::string_view extension = extension_of(name);
  if (extension.empty()) {
    return kDefaultExtensionWeight;
  }
  for (const auto& entry : extension_weights()) {
    if (entry.key == extension) {
      return entry.weight;
    }
  }
  return kDefaultExtensionWeight;
}

double code_pattern_score(const std::string_view section_text,
                          std::vector<std::string>* matched) {
  std::vector<std::string> added;
  for (const auto line : core::split_lines(section_text)) {
    if (diff::is_addition_line(line) && line.size() <= kMaxPatternLineLength) {
      added.emplace_back(line.substr(1));
    }
  }

  double factor = 1.0;
  bool any_match = false;
  for (const auto& pattern : code_patterns()) {
    const bool hit = std::any_of(added.begin(), added.end(), [&pattern](const std::string& line) {
      return line_matches(pattern.regex, line);
    });
    if (!hit) {
      continue;
    }
    factor *= pattern.multiplier;
    any_match = true;
    if (matched != nullptr) {
      matched->emplace_back(pattern.name);
    }
  }

  return any_match ? factor : kNoPatternPenalty;
}

double volume_factor(const std::size_t total_changes) {
  const double changes = static_cast<double>(total_changes);
  return 1.0 + std::min(1.0, 0.1 * (changes / 5.0));
}

double change_kind_factor(const diff::ChangeKind kind) {
  switch (kind) {
    case diff::ChangeKind::kAdded:
      return 1.2;
    case diff::ChangeKind::kDeleted:
      return 1.1;
    case diff::ChangeKind::kModified:
    case diff::ChangeKind::kRenamed:
    case diff::ChangeKind::kUnknown:
      break;
  }
  return 1.0;
}

ScoreBreakdown score_breakdown(const diff::DiffSection& section) {
  ScoreBreakdown breakdown;
  breakdown.extension_factor = section.file_path.has_value()
                                   ? extension_score(*section.file_path)
                                   : kDefaultExtensionWeight;
  breakdown.change_kind_factor = change_kind_factor(section.change_kind);
  breakdown.volume_factor = volume_factor(section.total_changes());
  breakdown.pattern_factor = code_pattern_score(section.raw_text, &breakdown.matched_patterns);
  return breakdown;
}

double score(const std::string_view section_text) {
  return score_breakdown(diff::parse_section(std::string{section_text})).total();
}

std::vector<ScoredSection> score_sections(std::vector<std::string> sections) {
  std::vector<ScoredSection> scored;
  scored.reserve(sections.size());
  for (auto& text : sections) {
    ScoredSection entry;
    entry.section = diff::parse_section(std::move(text));
    entry.score = score_breakdown(entry.section).total();
    scored.push_back(std::move(entry));
  }
  return scored;
}

}  // namespace diffbudget::scoring
