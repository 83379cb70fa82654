#include "score.h"

#include "diffbudget/diff/diff_section.h"
#include "diffbudget/diff/section_splitter.h"
#include "diffbudget/scoring/importance_scorer.h"

#include <nlohmann/json.hpp>

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct ScoreCliConfig {
  InputOptions input;
  bool json{false};
};

struct ScoredRow {
  std::size_t index = 0;
  diffbudget::diff::DiffSection section;
  diffbudget::scoring::ScoreBreakdown breakdown;
};

}  // namespace

int cmd_score(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = input_options<ScoreCliConfig>();
  options.push_back({"--json", false, "Print the score breakdown as JSON",
                     [](ScoreCliConfig& c, const std::string& /*v*/) {
                       c.json = true;
                       return true;
                     }});

  const auto parsed = diffbudget::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: diffbudget_cli score [options] < diff\n"
              << diffbudget::apps::format_options(options);
    return 1;
  }

  auto diff = read_diff_input(parsed.config.input);
  if (!diff.has_value()) {
    std::cerr << diff.error() << "\n";
    return 1;
  }

  std::vector<ScoredRow> rows;
  for (auto& text : diffbudget::diff::split_diff(diff.value())) {
    ScoredRow row;
    row.index = rows.size();
    row.section = diffbudget::diff::parse_section(std::move(text));
    row.breakdown = diffbudget::scoring::score_breakdown(row.section);
    rows.push_back(std::move(row));
  }
  std::stable_sort(rows.begin(), rows.end(), [](const ScoredRow& a, const ScoredRow& b) {
    return a.breakdown.total() > b.breakdown.total();
  });

  if (parsed.config.json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& row : rows) {
      nlohmann::json entry;
      entry["index"] = row.index;
      entry["file_path"] = row.section.file_path.has_value()
                               ? nlohmann::json(*row.section.file_path)
                               : nlohmann::json(nullptr);
      entry["change_kind"] = diffbudget::diff::change_kind_to_string(row.section.change_kind);
      entry["additions"] = row.section.addition_count;
      entry["deletions"] = row.section.deletion_count;
      entry["factors"] = {
          {"extension", row.breakdown.extension_factor},
          {"change_kind", row.breakdown.change_kind_factor},
          {"volume", row.breakdown.volume_factor},
          {"pattern", row.breakdown.pattern_factor},
      };
      entry["matched_patterns"] = row.breakdown.matched_patterns;
      entry["score"] = row.breakdown.total();
      out.push_back(entry);
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  for (const auto& row : rows) {
    std::cout << std::fixed << std::setprecision(3) << row.breakdown.total() << "  "
              << row.section.file_path.value_or("(unknown)") << " ("
              << diffbudget::diff::change_kind_to_string(row.section.change_kind) << ", +"
              << row.section.addition_count << "/-" << row.section.deletion_count << ")\n";
  }
  return 0;
}
