#include "truncate.h"

#include "diffbudget/diff/diff_section.h"
#include "diffbudget/diff/section_splitter.h"
#include "diffbudget/preprocess/preprocessor.h"
#include "diffbudget/scoring/importance_scorer.h"
#include "diffbudget/truncation/budget_truncator.h"

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TruncateCliConfig {
  InputOptions input;
  int token_limit{diffbudget::preprocess::kDefaultTokenLimit};
  std::string model{diffbudget::preprocess::kDefaultModel};
  std::string tokenizer{"encoding"};
};

}  // namespace

int cmd_truncate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = input_options<TruncateCliConfig>();
  options.push_back({"--token-limit", true, "Token budget for the output",
                     [](TruncateCliConfig& c, const std::string& v) {
                       return diffbudget::apps::parse_int_flag("--token-limit", v, c.token_limit);
                     }});
  options.push_back({"--model", true, "Model name used to pick the tokenizer encoding",
                     [](TruncateCliConfig& c, const std::string& v) {
                       c.model = v;
                       return true;
                     }});
  options.push_back({"--tokenizer", true, "Token counter (encoding|heuristic)",
                     [](TruncateCliConfig& c, const std::string& v) {
                       if (v == "encoding" || v == "heuristic") {
                         c.tokenizer = v;
                         return true;
                       }
                       std::cerr << "Invalid --tokenizer: " << v
                                 << " (valid: encoding, heuristic)\n";
                       return false;
                     }});

  const auto parsed = diffbudget::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok || !parsed.positionals.empty()) {
    std::cerr << "Usage: diffbudget_cli truncate [options] < diff\n"
              << diffbudget::apps::format_options(options);
    return 1;
  }
  const TruncateCliConfig& config = parsed.config;

  const auto counter = make_token_counter(config.tokenizer);
  if (counter == nullptr) {
    std::cerr << "Unknown tokenizer: " << config.tokenizer << "\n";
    return 1;
  }

  auto diff = read_diff_input(config.input);
  if (!diff.has_value()) {
    std::cerr << diff.error() << "\n";
    return 1;
  }

  std::vector<diffbudget::scoring::ScoredSection> sections;
  for (auto& text : diffbudget::diff::split_diff(diff.value())) {
    sections.push_back({diffbudget::diff::parse_section(std::move(text)), 1.0});
  }

  diffbudget::truncation::TruncationOptions truncation_options;
  truncation_options.model = config.model;
  const diffbudget::truncation::BudgetTruncator truncator(*counter, truncation_options);
  std::cout << truncator.truncate(sections, config.token_limit).render();
  return 0;
}
