#include "diffbudget/diff/section_splitter.h"

#include "diffbudget/core/text.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace diffbudget::diff;

namespace {

const std::string kTwoFileDiff =
    "diff --git a/src/main.py b/src/main.py\n"
    "index 1111111..2222222 100644\n"
    "--- a/src/main.py\n"
    "+++ b/src/main.py\n"
    "@@ -1,2 +1,3 @@\n"
    " import os\n"
    "+import sys\n"
    " print('hi')\n"
    "diff --git a/README.md b/README.md\n"
    "index 3333333..4444444 100644\n"
    "--- a/README.md\n"
    "+++ b/README.md\n"
    "@@ -1 +1 @@\n"
    "-old\n"
    "+new\n";

}  // namespace

TEST_CASE("split_diff: empty input yields no sections", "[diff][splitter]") {
  CHECK(split_diff("").empty());
}

TEST_CASE("split_diff: one section per file", "[diff][splitter]") {
  const auto sections = split_diff(kTwoFileDiff);
  REQUIRE(sections.size() == 2);
  CHECK(sections[0].starts_with("diff --git a/src/main.py"));
  CHECK(sections[1].starts_with("diff --git a/README.md"));
}

TEST_CASE("split_diff: concatenation reproduces the input", "[diff][splitter]") {
  const std::string with_preamble = "From abc123 Mon Sep 17 00:00:00 2001\n\n" + kTwoFileDiff;
  const auto sections = split_diff(with_preamble);
  REQUIRE(sections.size() == 3);
  CHECK(sections[0] == "From abc123 Mon Sep 17 00:00:00 2001\n\n");
  CHECK(diffbudget::core::join(sections, "") == with_preamble);
}

TEST_CASE("split_diff: input without a boundary is one section", "[diff][splitter]") {
  const auto sections = split_diff("just some text\nwithout headers\n");
  REQUIRE(sections.size() == 1);
  CHECK(sections[0] == "just some text\nwithout headers\n");
}

TEST_CASE("split_diff: boundary text inside a line does not split", "[diff][splitter]") {
  const std::string diff =
      "diff --git a/notes.txt b/notes.txt\n"
      "@@ -0,0 +1 @@\n"
      "+mention of diff --git a/x b/x inline\n";
  const auto sections = split_diff(diff);
  REQUIRE(sections.size() == 1);
  CHECK(sections[0] == diff);
}
