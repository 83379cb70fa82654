#include "diffbudget/core/text.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace diffbudget::core;

TEST_CASE("split_lines: trailing newline yields trailing empty element", "[core][text]") {
  const auto lines = split_lines("a\nb\n");
  REQUIRE(lines.size() == 3);
  CHECK(lines[0] == "a");
  CHECK(lines[1] == "b");
  CHECK(lines[2].empty());

  CHECK(split_lines("").size() == 1);
}

TEST_CASE("strip: removes ASCII whitespace at both ends", "[core][text]") {
  CHECK(strip("  \tvalue \r\n") == "value");
  CHECK(strip("   ").empty());
  CHECK(is_blank(" \t\n"));
  CHECK_FALSE(is_blank(" x "));
}

TEST_CASE("strip_ansi: removes color sequences", "[core][text][ansi]") {
  const std::string colored = "\x1B[1mdiff --git a/x b/x\x1B[m\n\x1B[32m+added\x1B[0m\n";
  CHECK(strip_ansi(colored) == "diff --git a/x b/x\n+added\n");
}

TEST_CASE("strip_ansi: plain text is untouched", "[core][text][ansi]") {
  const std::string plain = "diff --git a/x b/x\n-removed [not an escape]\n";
  CHECK(strip_ansi(plain) == plain);
}

TEST_CASE("strip_ansi: incomplete escape is kept", "[core][text][ansi]") {
  const std::string dangling = std::string("tail\x1B");
  CHECK(strip_ansi(dangling) == dangling);

  const std::string unterminated = std::string("x\x1B[12");
  CHECK(strip_ansi(unterminated) == unterminated);
}

TEST_CASE("strip_ansi: two-byte escapes are removed", "[core][text][ansi]") {
  CHECK(strip_ansi(std::string("a\x1B") + "Mb") == "ab");
}

TEST_CASE("join: separator only between elements", "[core][text]") {
  const std::vector<std::string> parts{"a", "b", "c"};
  CHECK(join(parts, ", ") == "a, b, c");
  CHECK(join(std::vector<std::string>{}, ", ").empty());
}
