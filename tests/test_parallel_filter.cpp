#include "diffbudget/filtering/parallel_filter.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace diffbudget::filtering;

namespace {

std::string python_section(int i) {
  const std::string name = "file" + std::to_string(i) + ".py";
  return "diff --git a/" + name + " b/" + name + "\n+def foo():\n+    return " +
         std::to_string(i) + "\n";
}

std::string binary_section(int i) {
  const std::string name = "image" + std::to_string(i) + ".png";
  return "diff --git a/" + name + " b/" + name + "\nBinary files a/" + name + " and b/" + name +
         " differ\n";
}

std::vector<std::string> mixed_sections(int count) {
  std::vector<std::string> sections;
  for (int i = 0; i < count; ++i) {
    switch (i % 4) {
      case 0:
        sections.push_back(binary_section(i));
        break;
      case 1:
        sections.push_back("diff --git a/yarn.lock b/yarn.lock\n+x\n");
        break;
      default:
        sections.push_back(python_section(i));
        break;
    }
  }
  return sections;
}

}  // namespace

TEST_CASE("filter_sections: small input runs sequentially", "[filtering][parallel]") {
  const std::vector<std::string> sections = {python_section(1), binary_section(2)};
  const auto outcome = filter_sections(sections);

  REQUIRE(outcome.kept.size() == 1);
  CHECK(outcome.kept[0] == sections[0]);
  REQUIRE(outcome.excluded.size() == 1);
  CHECK(outcome.excluded[0].index == 1);
  CHECK(outcome.excluded[0].reason == ExclusionReason::kBinary);
  CHECK(outcome.workers_used == 1);
}

TEST_CASE("filter_sections: larger input keeps every ordinary section", "[filtering][parallel]") {
  std::vector<std::string> sections;
  for (int i = 0; i < 5; ++i) {
    sections.push_back(python_section(i));
  }
  const auto outcome = filter_sections(sections);

  CHECK(outcome.kept == sections);
  CHECK(outcome.excluded.empty());
  CHECK(outcome.workers_used >= 1);
  CHECK(outcome.workers_used <= kMaxFilterWorkers);
}

TEST_CASE("classify_sections: parallel verdicts match the sequential run",
          "[filtering][parallel][determinism]") {
  const auto sections = mixed_sections(64);

  const auto sequential = classify_sections(sections, FilterOptions{1});
  for (int run = 0; run < 5; ++run) {
    std::size_t workers_used = 0;
    const auto parallel = classify_sections(sections, FilterOptions{4}, &workers_used);
    CHECK(parallel == sequential);
    CHECK(workers_used >= 1);
  }
}

TEST_CASE("filter_sections: kept order follows input order", "[filtering][parallel]") {
  const auto sections = mixed_sections(20);
  const auto outcome = filter_sections(sections, FilterOptions{4});

  std::vector<std::string> expected;
  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (i % 4 >= 2) {
      expected.push_back(sections[i]);
    }
  }
  CHECK(outcome.kept == expected);
  REQUIRE(outcome.excluded.size() == 10);
  for (std::size_t i = 1; i < outcome.excluded.size(); ++i) {
    CHECK(outcome.excluded[i - 1].index < outcome.excluded[i].index);
  }
}

TEST_CASE("filter_sections: empty input", "[filtering][parallel]") {
  const auto outcome = filter_sections({});
  CHECK(outcome.kept.empty());
  CHECK(outcome.excluded.empty());
}
