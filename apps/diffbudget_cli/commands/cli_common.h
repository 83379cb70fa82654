#pragma once

#include "diffbudget/core/result.h"
#include "diffbudget/tokenization/token_counter.h"

#include "shared/arg_parser.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

// InputOptions is embedded in every subcommand's config: where the diff comes from and
// whether its ANSI colors are kept.
struct InputOptions {
  std::optional<std::string> input_path;  // NOLINT(readability-identifier-naming)
  bool keep_color{false};                 // NOLINT(readability-identifier-naming)
};

// read_diff_input reads the whole diff from input_path, or stdin when unset, and strips ANSI
// escape sequences unless keep_color is set.
diffbudget::core::Result<std::string, std::string> read_diff_input(const InputOptions& input);

// make_token_counter builds the named counter: "encoding" or "heuristic".
// Returns nullptr for an unknown name.
std::unique_ptr<diffbudget::tokenization::ITokenCounter> make_token_counter(
    const std::string& name);

// input_options returns the --input and --keep-color flags for a config with an `input` member.
template <typename Config>
std::vector<diffbudget::apps::Option<Config>> input_options() {
  return {
      {"--input", true, "Read the diff from a file instead of stdin",
       [](Config& c, const std::string& v) {
         c.input.input_path = v;
         return true;
       }},
      {"--keep-color", false, "Do not strip ANSI color codes from the input",
       [](Config& c, const std::string& /*v*/) {
         c.input.keep_color = true;
         return true;
       }},
  };
}
