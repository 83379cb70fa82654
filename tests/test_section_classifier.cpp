#include "diffbudget/filtering/section_classifier.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace diffbudget::filtering;

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += lines[i];
  }
  return out;
}

}  // namespace

// ── minified content heuristics ──

TEST_CASE("is_minified_content: single long line", "[filtering][minified]") {
  CHECK(is_minified_content(std::string(250, 'a')));
}

TEST_CASE("is_minified_content: few lines, many characters", "[filtering][minified]") {
  std::string text = join_lines(std::vector<std::string>(8, std::string(120, 'b')));
  text += std::string(1001 - text.size(), 'c');
  CHECK(is_minified_content(text));
}

TEST_CASE("is_minified_content: long space-poor line", "[filtering][minified]") {
  CHECK(is_minified_content(std::string(350, 'd')));

  std::vector<std::string> lines(12, "short line of code");
  lines[5] = std::string(400, 'x');
  CHECK(is_minified_content(join_lines(lines)));
}

TEST_CASE("is_minified_content: share of very long lines", "[filtering][minified]") {
  std::vector<std::string> lines(3, std::string(600, 'e'));
  for (int i = 0; i < 7; ++i) {
    lines.emplace_back("short");
  }
  CHECK(is_minified_content(join_lines(lines)));
}

TEST_CASE("is_minified_content: ordinary code is kept", "[filtering][minified]") {
  const std::string normal =
      "function formatText() {\n    // Normal function\n    const text = \"Hello world\";\n"
      "    return text.trim();\n}";
  CHECK_FALSE(is_minified_content(normal));
  CHECK_FALSE(is_minified_content(""));
}

TEST_CASE("is_minified_content: long prose line with spaces is kept", "[filtering][minified]") {
  std::string prose;
  while (prose.size() < 400) {
    prose += "word ";
  }
  std::vector<std::string> lines(12, "x = 1");
  lines[3] = prose;
  CHECK_FALSE(is_minified_content(join_lines(lines)));
}

// ── path checks ──

TEST_CASE("is_lockfile_or_generated: lockfiles and generated sources", "[filtering][lockfile]") {
  CHECK(is_lockfile_or_generated("package-lock.json"));
  CHECK(is_lockfile_or_generated("yarn.lock"));
  CHECK(is_lockfile_or_generated("Pipfile.lock"));
  CHECK(is_lockfile_or_generated("poetry.lock"));
  CHECK(is_lockfile_or_generated("frontend/pnpm-lock.yaml"));
  CHECK(is_lockfile_or_generated("go.sum"));
  CHECK(is_lockfile_or_generated("user.pb.go"));
  CHECK(is_lockfile_or_generated("model.g.dart"));
  CHECK(is_lockfile_or_generated("autogen.go"));

  CHECK_FALSE(is_lockfile_or_generated("main.py"));
  CHECK_FALSE(is_lockfile_or_generated("index.js"));
  CHECK_FALSE(is_lockfile_or_generated("README.md"));
}

TEST_CASE("has_minified_extension: suffix list", "[filtering][minified]") {
  CHECK(has_minified_extension("static/app.min.js"));
  CHECK(has_minified_extension("styles/site.bundle.css"));
  CHECK_FALSE(has_minified_extension("src/app.js"));
  CHECK_FALSE(has_minified_extension("min.js"));
}

TEST_CASE("is_in_build_directory: nested build output", "[filtering][build]") {
  CHECK(is_in_build_directory("web/dist/app.js"));
  CHECK(is_in_build_directory("pkg/node_modules/left-pad/index.js"));
  CHECK(is_in_build_directory("lib/vendor/foo.c"));
  CHECK_FALSE(is_in_build_directory("src/distance.py"));
  CHECK_FALSE(is_in_build_directory("dist/app.js"));
}

TEST_CASE("is_binary_section: git binary markers", "[filtering][binary]") {
  CHECK(is_binary_section(
      "diff --git a/logo.png b/logo.png\nBinary files a/logo.png and b/logo.png differ\n"));
  CHECK(is_binary_section("diff --git a/x.bin b/x.bin\nGIT binary patch\nliteral 12\n"));
  CHECK_FALSE(is_binary_section("diff --git a/a.py b/a.py\n+print('Binary files')\n"));
}

// ── classification ──

TEST_CASE("classify_section: reasons in check order", "[filtering][classifier]") {
  SECTION("binary") {
    CHECK(classify_section("diff --git a/file.bin b/file.bin\n"
                           "Binary files a/file.bin and b/file.bin differ\n") ==
          ExclusionReason::kBinary);
  }
  SECTION("lockfile") {
    CHECK(classify_section("diff --git a/package-lock.json b/package-lock.json\n+{}\n") ==
          ExclusionReason::kLockfileOrGenerated);
  }
  SECTION("minified extension wins over build directory") {
    CHECK(classify_section("diff --git a/web/dist/app.min.js b/web/dist/app.min.js\n+x\n") ==
          ExclusionReason::kMinifiedExtension);
  }
  SECTION("build directory") {
    CHECK(classify_section("diff --git a/web/dist/app.js b/web/dist/app.js\n+x\n") ==
          ExclusionReason::kBuildDirectory);
  }
  SECTION("ordinary source is kept") {
    CHECK(classify_section("diff --git a/main.py b/main.py\n+def foo():\n+    return 1\n") ==
          ExclusionReason::kNone);
  }
}

TEST_CASE("classify_section: minified content despite plain .js extension",
          "[filtering][classifier][minified]") {
  const std::string section = "diff --git a/min.js b/min.js\n+" + std::string(350, 'a');
  CHECK(classify_section(section) == ExclusionReason::kMinifiedContent);
  CHECK(should_exclude(section));
}

TEST_CASE("classify_section: path-less text only gets the binary check", "[filtering][classifier]") {
  CHECK(classify_section("+" + std::string(2000, 'a')) == ExclusionReason::kNone);
  CHECK(classify_section("Binary files a/x and b/x differ\n") == ExclusionReason::kBinary);
}

TEST_CASE("exclusion_reason_to_string: stable names", "[filtering]") {
  CHECK(std::string(exclusion_reason_to_string(ExclusionReason::kBinary)) == "binary");
  CHECK(std::string(exclusion_reason_to_string(ExclusionReason::kLockfileOrGenerated)) ==
        "lockfile_or_generated");
  CHECK(std::string(exclusion_reason_to_string(ExclusionReason::kNone)) == "none");
  CHECK(std::string(exclusion_reason_description(ExclusionReason::kLockfileOrGenerated)) ==
        "Filtered out lockfile or generated file");
}

// ── summaries ──

TEST_CASE("summarize_excluded_section: header lines plus tag", "[filtering][summary]") {
  const std::string section =
      "diff --git a/logo.png b/logo.png\n"
      "new file mode 100644\n"
      "index 0000000..1234567\n"
      "Binary files /dev/null and b/logo.png differ\n";
  CHECK(summarize_excluded_section(section, ExclusionReason::kBinary) ==
        "diff --git a/logo.png b/logo.png\n"
        "new file mode 100644\n"
        "index 0000000..1234567\n"
        "[Binary file change]\n");
}

TEST_CASE("summarize_excluded_section: hunks are dropped", "[filtering][summary]") {
  const std::string section =
      "diff --git a/yarn.lock b/yarn.lock\n"
      "index 1..2 100644\n"
      "--- a/yarn.lock\n"
      "+++ b/yarn.lock\n"
      "@@ -1 +1 @@\n"
      "-old\n"
      "+new\n";
  CHECK(summarize_excluded_section(section, ExclusionReason::kLockfileOrGenerated) ==
        "diff --git a/yarn.lock b/yarn.lock\n"
        "index 1..2 100644\n"
        "[Lockfile/generated file change]\n");
}

TEST_CASE("summarize_excluded_section: no header gives empty text", "[filtering][summary]") {
  CHECK(summarize_excluded_section("Binary files a/x and b/x differ\n", ExclusionReason::kBinary)
            .empty());
}
