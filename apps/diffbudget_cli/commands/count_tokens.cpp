#include "count_tokens.h"

#include "diffbudget/preprocess/preprocessor.h"

#include "cli_common.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>

namespace {

struct CountTokensCliConfig {
  InputOptions input;
  std::string model{diffbudget::preprocess::kDefaultModel};
  std::string tokenizer{"encoding"};
};

}  // namespace

int cmd_count_tokens(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto options = input_options<CountTokensCliConfig>();
  options.push_back({"--model", true, "Model name used to pick the tokenizer encoding",
                     [](CountTokensCliConfig& c, const std::string& v) {
                       c.model = v;
                       return true;
                     }});
  options.push_back({"--tokenizer", true, "Token counter (encoding|heuristic)",
                     [](CountTokensCliConfig& c, const std::string& v) {
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
    std::cerr << "Usage: diffbudget_cli count-tokens [options] < text\n"
              << diffbudget::apps::format_options(options);
    return 1;
  }

  const auto counter = make_token_counter(parsed.config.tokenizer);
  if (counter == nullptr) {
    std::cerr << "Unknown tokenizer: " << parsed.config.tokenizer << "\n";
    return 1;
  }

  auto text = read_diff_input(parsed.config.input);
  if (!text.has_value()) {
    std::cerr << text.error() << "\n";
    return 1;
  }

  std::cout << counter->count_tokens(text.value(), parsed.config.model) << "\n";
  return 0;
}
