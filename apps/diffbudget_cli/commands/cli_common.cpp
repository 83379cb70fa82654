#include "cli_common.h"

#include "diffbudget/core/text.h"
#include "diffbudget/tokenization/encoding_token_counter.h"
#include "diffbudget/tokenization/heuristic_token_counter.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

diffbudget::core::Result<std::string, std::string> read_diff_input(const InputOptions& input) {
  using InputResult = diffbudget::core::Result<std::string, std::string>;

  std::string text;
  if (input.input_path.has_value()) {
    std::ifstream file(input.input_path.value(), std::ios::binary);
    if (!file) {
      return InputResult::err("Cannot open input file: " + input.input_path.value());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
      return InputResult::err("Failed to read input file: " + input.input_path.value());
    }
    text = buffer.str();
  } else {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    if (std::cin.bad()) {
      return InputResult::err("Failed to read diff from stdin");
    }
  }

  if (!input.keep_color) {
    text = diffbudget::core::strip_ansi(text);
  }
  return InputResult::ok(std::move(text));
}

std::unique_ptr<diffbudget::tokenization::ITokenCounter> make_token_counter(
    const std::string& name) {
  if (name == "encoding") {
    return std::make_unique<diffbudget::tokenization::EncodingTokenCounter>();
  }
  if (name == "heuristic") {
    return std::make_unique<diffbudget::tokenization::HeuristicTokenCounter>();
  }
  return nullptr;
}
