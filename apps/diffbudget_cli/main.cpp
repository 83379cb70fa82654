#include "diffbudget/core/version.h"

#include "commands/count_tokens.h"
#include "commands/filter.h"
#include "commands/preprocess.h"
#include "commands/score.h"
#include "commands/truncate.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: diffbudget_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  preprocess     Filter, score and truncate a diff to a token budget\n"
            << "  filter         Drop binary, minified, build and lockfile sections\n"
            << "  score          Print per-section importance scores\n"
            << "  truncate       Fit a diff into a token budget in input order\n"
            << "  count-tokens   Print the token count of the input\n"
            << "\n"
            << "Every command reads the diff from --input <file> or stdin.\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }
  if (subcommand == "--version") {
    std::cout << "diffbudget " << diffbudget::core::kBuildVersion << "\n";
    return 0;
  }
  if (subcommand == "preprocess") {
    return cmd_preprocess(argc, argv);
  }
  if (subcommand == "filter") {
    return cmd_filter(argc, argv);
  }
  if (subcommand == "score") {
    return cmd_score(argc, argv);
  }
  if (subcommand == "truncate") {
    return cmd_truncate(argc, argv);
  }
  if (subcommand == "count-tokens") {
    return cmd_count_tokens(argc, argv);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
