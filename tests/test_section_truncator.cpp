#include "diffbudget/truncation/section_truncator.h"

#include "fake_token_counter.h"
#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace diffbudget;

namespace {

const std::string kModel = "test:model";

// 15-word header followed by `lines` added lines of 3 words each.
std::string oversized_section(int lines) {
  std::string text =
      "diff --git a/big.py b/big.py\n"
      "index 1..2 100644\n"
      "--- a/big.py\n"
      "+++ b/big.py\n"
      "@@ -1,3 +1,40 @@\n";
  for (int i = 0; i < lines; ++i) {
    text += "+value_" + std::to_string(i) + " = " + std::to_string(i) + "\n";
  }
  return text;
}

bool ends_with_marker(const std::string& text) {
  return text.ends_with(std::string(truncation::kTruncationMarker) + "\n");
}

}  // namespace

TEST_CASE("truncate_section: text that fits is unchanged", "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const std::string section = oversized_section(3);

  const auto result = truncation::truncate_section(section, 1000, counter, kModel);
  CHECK(result.text == section);
  CHECK(result.token_count == 24);
  CHECK_FALSE(result.truncated);
}

TEST_CASE("truncate_section: non-positive budget yields nothing", "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const auto result = truncation::truncate_section(oversized_section(40), 0, counter, kModel);
  CHECK(result.text.empty());
  CHECK(result.token_count == 0);
}

TEST_CASE("truncate_section: header larger than budget cuts line by line",
          "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const auto result = truncation::truncate_section(oversized_section(40), 20, counter, kModel);

  CHECK(result.truncated);
  CHECK(result.token_count <= 20);
  CHECK(counter.count_tokens(result.text, kModel) == result.token_count);
  CHECK(ends_with_marker(result.text));
  CHECK(result.text ==
        "diff --git a/big.py b/big.py\n"
        "index 1..2 100644\n"
        "--- a/big.py\n"
        "+++ b/big.py\n"
        "[... truncated due to token limit ...]\n");
}

TEST_CASE("truncate_section: header kept whole and changes fill the rest",
          "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const auto result = truncation::truncate_section(oversized_section(40), 40, counter, kModel);

  CHECK(result.truncated);
  CHECK(result.token_count == 40);
  CHECK(result.text.starts_with(oversized_section(0)));
  CHECK(result.text.find("+value_5 = 5\n") != std::string::npos);
  CHECK(result.text.find("+value_6 = 6\n") == std::string::npos);
  CHECK(ends_with_marker(result.text));
}

TEST_CASE("truncate_section: changed lines outrank context", "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const std::string section =
      "diff --git a/a.py b/a.py\n"
      "@@ -1,4 +1,4 @@\n"
      " context one two three\n"
      "-old line\n"
      "+new line\n"
      " context four five six\n";

  const auto result = truncation::truncate_section(section, 19, counter, kModel);
  CHECK(result.text ==
        "diff --git a/a.py b/a.py\n"
        "@@ -1,4 +1,4 @@\n"
        "-old line\n"
        "+new line\n"
        "[... truncated due to token limit ...]\n");
  CHECK(result.token_count == 19);
}

TEST_CASE("truncate_section: budget below the marker keeps leading lines unmarked",
          "[truncation][section]") {
  const testing::WordTokenCounter counter;

  // The marker costs 7 words; the first line costs 4.
  const auto five = truncation::truncate_section(oversized_section(40), 5, counter, kModel);
  CHECK(five.text == "diff --git a/big.py b/big.py\n");
  CHECK(five.token_count == 4);
  CHECK(five.truncated);

  const auto seven = truncation::truncate_section(oversized_section(40), 7, counter, kModel);
  CHECK(seven.text ==
        "diff --git a/big.py b/big.py\n"
        "index 1..2 100644\n");
  CHECK(seven.token_count == 7);
  CHECK_FALSE(ends_with_marker(seven.text));
}

TEST_CASE("truncate_section: marker that leaves no room for a line is dropped",
          "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const auto result = truncation::truncate_section(oversized_section(40), 8, counter, kModel);
  CHECK(result.text ==
        "diff --git a/big.py b/big.py\n"
        "index 1..2 100644\n");
  CHECK(result.token_count == 7);
}

TEST_CASE("truncate_section: first line larger than budget yields nothing",
          "[truncation][section]") {
  const testing::WordTokenCounter counter;
  const auto result = truncation::truncate_section(oversized_section(40), 3, counter, kModel);
  CHECK(result.text.empty());
  CHECK(result.token_count == 0);
  CHECK(result.truncated);
}
