#include "diffbudget/scoring/importance_tables.h"

#include <array>

namespace diffbudget::scoring {

namespace {

constexpr std::array<WeightEntry, 40> kExtensionWeights = {{
    // Source code
    {".py", 5.0},
    {".js", 4.5},
    {".ts", 4.5},
    {".go", 4.5},
    {".rs", 4.5},
    {".jsx", 4.2},
    {".tsx", 4.2},
    {".java", 4.2},
    {".c", 4.2},
    {".cpp", 4.2},
    {".cc", 4.2},
    {".cs", 4.2},
    {".rb", 4.2},
    {".swift", 4.2},
    {".kt", 4.2},
    {".h", 4.0},
    {".hpp", 4.0},
    {".php", 4.0},
    {".scala", 4.0},
    // Configuration
    {".json", 3.5},
    {".yaml", 3.8},
    {".yml", 3.8},
    {".toml", 3.8},
    {".ini", 3.5},
    {".cfg", 3.5},
    {".conf", 3.5},
    // Documentation
    {".md", 4.0},
    {".rst", 3.8},
    {".adoc", 3.0},
    {".txt", 2.5},
    // Web
    {".html", 3.5},
    {".css", 3.0},
    {".scss", 3.0},
    {".sass", 3.0},
    {".less", 2.8},
    {".svg", 2.5},
    // Shell and build scripts
    {".sh", 3.5},
    {".cmake", 3.8},
    {".gradle", 3.8},
    {".sql", 3.5},
}};

constexpr std::array<WeightEntry, 12> kSpecialFileWeights = {{
    {"Dockerfile", 4.0},
    {"Makefile", 3.8},
    {"CMakeLists.txt", 4.0},
    {"package.json", 4.2},
    {"pyproject.toml", 4.2},
    {"setup.py", 4.0},
    {"requirements.txt", 4.0},
    {"Cargo.toml", 4.2},
    {"go.mod", 4.2},
    {".github/workflows", 4.0},
    {"Jenkinsfile", 3.8},
    {".gitlab-ci.yml", 3.8},
}};

struct PatternSource {
  std::string_view name;
  const char* source;
  double multiplier;
};

const std::array<PatternSource, 14> kPatternSources = {{
    {"type_definition",
     R"(^\s*(?:(?:export|public|private|protected|abstract|final|sealed|static|pub)\s+)*)"
     R"((?:class|interface|enum|struct|trait)\s+\w)",
     1.8},
    {"function_definition",
     R"(^\s*(?:(?:export\s+)?(?:async\s+)?(?:def|func|function|fn)\s+\w)"
     R"(|(?:(?:public|private|protected|internal|static|final|virtual|override|async|pub)\s+)+)"
     R"([\w<>\[\]:,*& ]*\w+\s*\())",
     1.5},
    {"import",
     R"(^\s*(?:import\s|from\s+\S+\s+import\s|#include\s*[<"]|using\s+[\w.:]+\s*;)"
     R"(|require\s*\(|use\s+[\w:]+))",
     1.3},
    {"access_modifier", R"(^\s*(?:public|private|protected|internal)\b)", 1.2},
    {"manifest_version_pin", R"(^\s*(?:"[\w@/.\-]+"\s*:|[\w\-]+\s*=)\s*"[~^>=<]*\d+(?:\.\d+)+)",
     1.4},
    {"requirement_pin", R"(^\s*[A-Za-z0-9_.\-\[\]]+\s*(?:==|>=|<=|~=|!=)\s*\d)", 1.3},
    {"control_flow", R"(^\s*(?:\}\s*)?(?:if|else|elif|for|while|switch|case)\b)", 1.2},
    {"exception_handling", R"(^\s*(?:\}\s*)?(?:try|catch|except|finally|raise|throw)\b)", 1.2},
    {"return_await_yield", R"(\b(?:return|await|yield)\b)", 1.1},
    {"todo", R"(\bTODO\b)", 1.2},
    {"fixme", R"(\b(?:FIXME|FIX|HACK)\b)", 1.3},
    {"docstring", R"("""|'''|/\*\*)", 1.1},
    {"test_definition",
     R"(^\s*(?:def\s+test_\w*|(?:it|describe|test)\s*\(|TEST(?:_F|_CASE)?\s*\()"
     R"(|@Test\b|func\s+Test\w*))",
     1.1},
    {"assertion", R"(\b(?:assert\w*|expect|REQUIRE|CHECK)\s*\(|^\s*assert\s)", 1.0},
}};

}  // namespace

std::span<const WeightEntry> extension_weights() {
  return kExtensionWeights;
}

std::span<const WeightEntry> special_file_weights() {
  return kSpecialFileWeights;
}

const std::vector<CodePattern>& code_patterns() {
  static const std::vector<CodePattern> patterns = [] {
    std::vector<CodePattern> compiled;
    compiled.reserve(kPatternSources.size());
    for (const auto& source : kPatternSources) {
      compiled.push_back(CodePattern{
          source.name, std::regex(source.source, std::regex::ECMAScript | std::regex::optimize),
          source.multiplier});
    }
    return compiled;
  }();
  return patterns;
}

}  // namespace diffbudget::scoring
