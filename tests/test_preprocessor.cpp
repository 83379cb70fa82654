#include "diffbudget/preprocess/preprocessor.h"

#include "diffbudget/cache/inmemory_preprocess_cache.h"
#include "diffbudget/core/clock.h"
#include "diffbudget/scoring/importance_scorer.h"

#include "fake_token_counter.h"
#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace diffbudget;

namespace {

const std::string kPythonSection =
    "diff --git a/app.py b/app.py\n"
    "new file mode 100644\n"
    "--- /dev/null\n"
    "+++ b/app.py\n"
    "@@ -0,0 +1,2 @@\n"
    "+def greet(name):\n"
    "+    return 'hi ' + name\n";

const std::string kLockfileSection =
    "diff --git a/package-lock.json b/package-lock.json\n"
    "index 1..2 100644\n"
    "--- a/package-lock.json\n"
    "+++ b/package-lock.json\n"
    "@@ -1 +1 @@\n"
    "-  \"version\": \"1.0.0\"\n"
    "+  \"version\": \"1.0.1\"\n";

std::string module_section(int i, int lines) {
  const std::string name = "mod" + std::to_string(i) + ".py";
  std::string text = "diff --git a/" + name + " b/" + name + "\n@@ -1 +1," +
                     std::to_string(lines) + " @@\n";
  for (int line = 0; line < lines; ++line) {
    text += "+x" + std::to_string(line) + " = " + std::to_string(i) + "\n";
  }
  return text;
}

}  // namespace

TEST_CASE("Preprocessor: empty diff makes no tokenizer calls", "[preprocess]") {
  const testing::WordTokenCounter counter;
  const preprocess::Preprocessor preprocessor(counter);

  const auto report = preprocessor.run("", 6000);
  CHECK(report.output.empty());
  CHECK(report.path == preprocess::PreprocessPath::kEmpty);
  CHECK(counter.calls() == 0);
  CHECK(preprocess::preprocess("", 6000, "any", counter).empty());
  CHECK(counter.calls() == 0);
}

TEST_CASE("Preprocessor: non-positive budget yields nothing", "[preprocess]") {
  const testing::WordTokenCounter counter;
  const preprocess::Preprocessor preprocessor(counter);

  CHECK(preprocessor.run(kPythonSection, 0).output.empty());
  CHECK(preprocessor.run(kPythonSection, -5).output.empty());
}

TEST_CASE("Preprocessor: lockfile is dropped and source kept", "[preprocess]") {
  const testing::WordTokenCounter counter;
  const std::string diff = kPythonSection + kLockfileSection;

  CHECK(scoring::score(kPythonSection) > 1.0);

  SECTION("small diff takes the filter-only path") {
    const preprocess::Preprocessor preprocessor(counter);
    const auto report = preprocessor.run(diff, 5000);

    CHECK(report.path == preprocess::PreprocessPath::kFilterOnly);
    CHECK(report.output == kPythonSection);
    CHECK(report.section_count == 2);
    REQUIRE(report.exclusions.size() == 1);
    CHECK(report.exclusions[0].index == 1);
    CHECK(report.exclusions[0].file_path == "package-lock.json");
    CHECK(report.exclusions[0].reason == filtering::ExclusionReason::kLockfileOrGenerated);
    CHECK_FALSE(report.truncation.has_value());
  }

  SECTION("full path includes only the source section") {
    preprocess::PreprocessOptions options;
    options.cheap_path_ratio = 0.0;
    const preprocess::Preprocessor preprocessor(counter, options);
    const auto report = preprocessor.run(diff, 5000);

    CHECK(report.path == preprocess::PreprocessPath::kFull);
    REQUIRE(report.truncation.has_value());
    CHECK(report.truncation->fast_path);
    CHECK(report.truncation->included_paths == std::vector<std::string>{"app.py"});
    CHECK(report.output == kPythonSection);
  }

  SECTION("convenience entry point") {
    CHECK(preprocess::preprocess(diff, 5000, "test:model", counter) == kPythonSection);
  }
}

TEST_CASE("Preprocessor: excluded sections can leave a stub", "[preprocess]") {
  const testing::WordTokenCounter counter;
  preprocess::PreprocessOptions options;
  options.summarize_excluded = true;
  const preprocess::Preprocessor preprocessor(counter, options);

  const auto report = preprocessor.run(kLockfileSection + kPythonSection, 5000);
  CHECK(report.path == preprocess::PreprocessPath::kFilterOnly);
  CHECK(report.output ==
        "diff --git a/package-lock.json b/package-lock.json\n"
        "index 1..2 100644\n"
        "[Lockfile/generated file change]\n" +
            kPythonSection);
}

TEST_CASE("Preprocessor: clean small diff passes through unchanged", "[preprocess]") {
  const testing::WordTokenCounter counter;
  const std::string diff = module_section(1, 3) + module_section(2, 3);

  const std::string once = preprocess::preprocess(diff, 6000, "test:model", counter);
  CHECK(once == diff);
  CHECK(preprocess::preprocess(once, 6000, "test:model", counter) == once);
}

TEST_CASE("Preprocessor: large diff is truncated within budget", "[preprocess]") {
  const testing::WordTokenCounter counter;
  std::string diff;
  for (int i = 0; i < 6; ++i) {
    diff += module_section(i, 40);
  }

  const preprocess::Preprocessor preprocessor(counter);
  const auto report = preprocessor.run(diff, 300);

  CHECK(report.path == preprocess::PreprocessPath::kFull);
  REQUIRE(report.truncation.has_value());
  CHECK(report.truncation->total_sections == 6);
  CHECK_FALSE(report.truncation->included_texts.empty());
  CHECK_FALSE(report.truncation->skipped_paths.empty());
  CHECK(counter.count_tokens(report.output, "any") <= 300);
  CHECK(report.workers_used >= 1);
}

TEST_CASE("Preprocessor: cached results are reused until they expire", "[preprocess][cache]") {
  const testing::WordTokenCounter counter;
  core::FixedClock clock(1'700'000'000);
  cache::InMemoryPreprocessCache cache(clock, 60);

  preprocess::Preprocessor preprocessor(counter);
  preprocessor.attach_cache(cache, clock);

  const std::string diff = kPythonSection + kLockfileSection;
  const auto first = preprocessor.run(diff, 5000);
  CHECK(first.path == preprocess::PreprocessPath::kFilterOnly);
  CHECK(cache.size() == 1);

  const int calls_after_first = counter.calls();
  const auto second = preprocessor.run(diff, 5000);
  CHECK(second.path == preprocess::PreprocessPath::kCached);
  CHECK(second.output == first.output);
  CHECK(counter.calls() == calls_after_first);

  // A different budget is a different key.
  CHECK(preprocessor.run(diff, 4000).path == preprocess::PreprocessPath::kFilterOnly);

  clock.advance(61);
  CHECK(preprocessor.run(diff, 5000).path == preprocess::PreprocessPath::kFilterOnly);
}

TEST_CASE("Preprocessor: cache entries are keyed by output-shaping options",
          "[preprocess][cache]") {
  const testing::WordTokenCounter counter;
  core::FixedClock clock(1'700'000'000);
  cache::InMemoryPreprocessCache cache(clock, 60);
  const std::string diff = kLockfileSection + kPythonSection;

  preprocess::Preprocessor plain(counter);
  plain.attach_cache(cache, clock);
  CHECK(plain.run(diff, 6000).output == kPythonSection);

  preprocess::PreprocessOptions options;
  options.summarize_excluded = true;
  preprocess::Preprocessor with_stubs(counter, options);
  with_stubs.attach_cache(cache, clock);

  const auto report = with_stubs.run(diff, 6000);
  CHECK(report.path == preprocess::PreprocessPath::kFilterOnly);
  CHECK(report.output.find("[Lockfile/generated file change]") != std::string::npos);
  CHECK(cache.size() == 2);

  CHECK(plain.run(diff, 6000).path == preprocess::PreprocessPath::kCached);
  CHECK(with_stubs.run(diff, 6000).path == preprocess::PreprocessPath::kCached);
}

TEST_CASE("Preprocessor: tiny budget keeps the leading lines of the top section",
          "[preprocess]") {
  const testing::WordTokenCounter counter;
  std::string diff = "diff --git a/x.py b/x.py\n@@ -0,0 +1,40 @@\n";
  for (int i = 0; i < 40; ++i) {
    diff += "+line number " + std::to_string(i) + "\n";
  }

  const preprocess::Preprocessor preprocessor(counter);
  const auto report = preprocessor.run(diff, 5);
  CHECK(report.path == preprocess::PreprocessPath::kFull);
  CHECK(report.output == "diff --git a/x.py b/x.py\n");
  REQUIRE(report.truncation.has_value());
  CHECK(report.truncation->truncated_section);
  CHECK(preprocess::preprocess(diff, 5, "test:model", counter) == "diff --git a/x.py b/x.py\n");
}

TEST_CASE("preprocess_path_to_string: stable names", "[preprocess]") {
  CHECK(std::string(preprocess::preprocess_path_to_string(preprocess::PreprocessPath::kFull)) ==
        "full");
  CHECK(std::string(preprocess::preprocess_path_to_string(
            preprocess::PreprocessPath::kFilterOnly)) == "filter_only");
}
