#include "diffbudget/cache/inmemory_preprocess_cache.h"
#include "diffbudget/config/preprocess_config.h"
#include "diffbudget/core/clock.h"

#include <nlohmann/json.hpp>

#include "fake_token_counter.h"
#include "preprocess_logic.h"
#include <catch2/catch_test_macros.hpp>

#include <iostream>
#include <sstream>
#include <string>

using namespace diffbudget;

namespace {

// Redirects a stream into a buffer for the lifetime of the guard.
class StreamCapture {
 public:
  explicit StreamCapture(std::ostream& stream) : stream_(stream), old_(stream.rdbuf()) {
    stream_.rdbuf(buffer_.rdbuf());
  }
  ~StreamCapture() { stream_.rdbuf(old_); }

  StreamCapture(const StreamCapture&) = delete;
  StreamCapture& operator=(const StreamCapture&) = delete;
  StreamCapture(StreamCapture&&) = delete;
  StreamCapture& operator=(StreamCapture&&) = delete;

  [[nodiscard]] std::string str() const { return buffer_.str(); }

 private:
  std::ostream& stream_;
  std::streambuf* old_;
  std::ostringstream buffer_;
};

const std::string kDiff =
    "diff --git a/main.py b/main.py\n+def foo():\n+    return 1\n"
    "diff --git a/yarn.lock b/yarn.lock\n+resolved \"x\"\n";

}  // namespace

TEST_CASE("execute_preprocess: prints the processed diff", "[cli][preprocess]") {
  const testing::WordTokenCounter counter;
  core::FixedClock clock(0);
  const config::PreprocessConfig cfg;

  StreamCapture out(std::cout);
  StreamCapture err(std::cerr);
  const int rc = execute_preprocess(kDiff, cfg, counter, nullptr, clock, false, false);

  CHECK(rc == 0);
  CHECK(out.str() == "diff --git a/main.py b/main.py\n+def foo():\n+    return 1\n");
  CHECK(err.str().empty());
}

TEST_CASE("execute_preprocess: verbose names each filtered file", "[cli][preprocess]") {
  const testing::WordTokenCounter counter;
  core::FixedClock clock(0);
  const config::PreprocessConfig cfg;

  StreamCapture out(std::cout);
  StreamCapture err(std::cerr);
  CHECK(execute_preprocess(kDiff, cfg, counter, nullptr, clock, false, true) == 0);

  CHECK(err.str().find("Filtered out lockfile or generated file: yarn.lock\n") !=
        std::string::npos);
  CHECK(err.str().find("Preprocess path: filter_only") != std::string::npos);
}

TEST_CASE("execute_preprocess: JSON report", "[cli][preprocess][json]") {
  const testing::WordTokenCounter counter;
  core::FixedClock clock(0);
  cache::InMemoryPreprocessCache store(clock);
  const config::PreprocessConfig cfg;

  std::string first;
  {
    StreamCapture out(std::cout);
    CHECK(execute_preprocess(kDiff, cfg, counter, &store, clock, true, false) == 0);
    first = out.str();
  }
  const auto report = nlohmann::json::parse(first);
  CHECK(report["path"] == "filter_only");
  CHECK(report["section_count"] == 2);
  REQUIRE(report["exclusions"].size() == 1);
  CHECK(report["exclusions"][0]["file_path"] == "yarn.lock");
  CHECK(report["exclusions"][0]["reason"] == "lockfile_or_generated");
  CHECK(report["truncation"].is_null());

  std::string second;
  {
    StreamCapture out(std::cout);
    CHECK(execute_preprocess(kDiff, cfg, counter, &store, clock, true, false) == 0);
    second = out.str();
  }
  const auto cached = nlohmann::json::parse(second);
  CHECK(cached["path"] == "cached");
  CHECK(cached["output"] == report["output"]);
}
