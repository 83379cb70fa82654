#include "filter.h"

#include "diffbudget/diff/diff_section.h"
#include "diffbudget/diff/section_splitter.h"
#include "diffbudget/filtering/exclusion.h"
#include "diffbudget/filtering/parallel_filter.h"
#include "diffbudget/filtering/section_classifier.h"

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct FilterCliConfig {
  InputOptions input;
  int max_workers{static_cast<int>(diffbudget::filtering::kMaxFilterWorkers)};
  bool summaries{false};
  bool verbose{false};
};

}  // namespace

int cmd_filter(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = input_options<FilterCliConfig>();
  options.push_back({"--max-workers", true, "Maximum classification worker threads",
                     [](FilterCliConfig& c, const std::string& v) {
                       if (!diffbudget::apps::parse_int_flag("--max-workers", v, c.max_workers)) {
                         return false;
                       }
                       if (c.max_workers < 1) {
                         std::cerr << "Invalid --max-workers: " << v << " (must be >= 1)\n";
                         return false;
                       }
                       return true;
                     }});
  options.push_back({"--summaries", false, "Replace dropped sections with header stubs",
                     [](FilterCliConfig& c, const std::string& /*v*/) {
                       c.summaries = true;
                       return true;
                     }});
  options.push_back({"--verbose", false, "Report each dropped section on stderr",
                     [](FilterCliConfig& c, const std::string& /*v*/) {
                       c.verbose = true;
                       return true;
                     }});

  const auto parsed = diffbudget::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: diffbudget_cli filter [options] < diff\n"
              << diffbudget::apps::format_options(options);
    return 1;
  }
  const FilterCliConfig& config = parsed.config;

  auto diff = read_diff_input(config.input);
  if (!diff.has_value()) {
    std::cerr << diff.error() << "\n";
    return 1;
  }

  const auto sections = diffbudget::diff::split_diff(diff.value());
  std::size_t workers_used = 1;
  const auto verdicts = diffbudget::filtering::classify_sections(
      sections, {static_cast<std::size_t>(config.max_workers)}, &workers_used);

  std::size_t dropped = 0;
  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (verdicts[i] == diffbudget::filtering::ExclusionReason::kNone) {
      std::cout << sections[i];
      continue;
    }
    ++dropped;
    if (config.verbose) {
      std::cerr << diffbudget::filtering::exclusion_reason_description(verdicts[i]) << ": "
                << diffbudget::diff::extract_file_path(sections[i]).value_or("(unknown)")
                << "\n";
    }
    if (config.summaries) {
      std::cout << diffbudget::filtering::summarize_excluded_section(sections[i], verdicts[i]);
    }
  }

  if (config.verbose) {
    std::cerr << "Kept " << (sections.size() - dropped) << " of " << sections.size()
              << " sections using " << workers_used << " worker(s)\n";
  }
  return 0;
}
