#include "diffbudget/filtering/section_classifier.h"

#include "diffbudget/core/text.h"
#include "diffbudget/diff/diff_section.h"

#include <array>
#include <regex>
#include <vector>

namespace diffbudget::filtering {

namespace {

constexpr std::array<std::string_view, 8> kMinifiedSuffixes = {
    ".min.js",  ".min.css",        ".bundle.js",      ".bundle.css",
    ".opt.js",  ".opt.css",        ".compressed.js",  ".compressed.css",
};

constexpr std::array<std::string_view, 7> kBuildDirectories = {
    "/dist/",          "/build/",         "/vendor/",       "/node_modules/",
    "/assets/vendor/", "/public/build/",  "/static/dist/",
};

// Path patterns for dependency lockfiles and code produced by generators.
const std::vector<std::regex>& lockfile_patterns() {
  static const std::vector<std::regex> patterns = [] {
    const std::array<const char*, 13> sources = {
        R"(package-lock\.json$)", R"(yarn\.lock$)",     R"(Pipfile\.lock$)",
        R"(poetry\.lock$)",       R"(Gemfile\.lock$)",  R"(pnpm-lock\.yaml$)",
        R"(composer\.lock$)",     R"(Cargo\.lock$)",    R"(\.sum$)",
        R"(\.pb\.go$)",           R"(\.g\.dart$)",      R"(autogen\.)",
        R"(generated\.)",
    };
    std::vector<std::regex> compiled;
    compiled.reserve(sources.size());
    for (const char* source : sources) {
      compiled.emplace_back(source, std::regex::ECMAScript | std::regex::optimize);
    }
    return compiled;
  }();
  return patterns;
}

constexpr std::string_view kBinaryPrefix = "Binary files ";
constexpr std::string_view kBinarySuffix = " differ";
constexpr std::string_view kBinaryPatch = "GIT binary patch";

const char* summary_tag(const ExclusionReason reason) {
  switch (reason) {
    case ExclusionReason::kBinary:
      return "[Binary file change]";
    case ExclusionReason::kMinifiedExtension:
    case ExclusionReason::kMinifiedContent:
      return "[Minified file change]";
    case ExclusionReason::kLockfileOrGenerated:
      return "[Lockfile/generated file change]";
    case ExclusionReason::kBuildDirectory:
      return "[Build artifact change]";
    case ExclusionReason::kNone:
      break;
  }
  return "";
}

}  // namespace

const char* exclusion_reason_to_string(const ExclusionReason reason) {
  switch (reason) {
    case ExclusionReason::kBinary:
      return "binary";
    case ExclusionReason::kMinifiedExtension:
      return "minified_extension";
    case ExclusionReason::kBuildDirectory:
      return "build_directory";
    case ExclusionReason::kLockfileOrGenerated:
      return "lockfile_or_generated";
    case ExclusionReason::kMinifiedContent:
      return "minified_content";
    case ExclusionReason::kNone:
      break;
  }
  return "none";
}

const char* exclusion_reason_description(const ExclusionReason reason) {
  switch (reason) {
    case ExclusionReason::kBinary:
      return "Filtered out binary file";
    case ExclusionReason::kMinifiedExtension:
      return "Filtered out minified file by extension";
    case ExclusionReason::kBuildDirectory:
      return "Filtered out file in build directory";
    case ExclusionReason::kLockfileOrGenerated:
      return "Filtered out lockfile or generated file";
    case ExclusionReason::kMinifiedContent:
      return "Filtered out likely minified file by content";
    case ExclusionReason::kNone:
      break;
  }
  return "Kept";
}

bool is_binary_section(const std::string_view section_text) {
  if (section_text.find(kBinaryPatch) != std::string_view::npos) {
    return true;
  }
  for (const auto raw_line : core::split_lines(section_text)) {
    std::string_view line = raw_line;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    if (line.starts_with(kBinaryPrefix) && line.ends_with(kBinarySuffix)) {
      return true;
    }
  }
  return false;
}

bool has_minified_extension(const std::string_view file_path) {
  for (const auto suffix : kMinifiedSuffixes) {
    if (file_path.ends_with(suffix)) {
      return true;
    }
  }
  return false;
}

bool is_in_build_directory(const std::string_view file_path) {
  for (const auto directory : kBuildDirectories) {
    if (file_path.find(directory) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

bool is_lockfile_or_generated(const std::string_view file_path) {
  const std::string path{file_path};
  for (const auto& pattern : lockfile_patterns()) {
    if (std::regex_search(path, pattern)) {
      return true;
    }
  }
  return false;
}

bool is_minified_content(const std::string_view content) {
  if (content.empty()) {
    return false;
  }

  const auto lines = core::split_lines(content);

  if (lines.size() < 10 && content.size() > 1000) {
    return true;
  }
  if (lines.size() == 1 && content.size() > 200) {
    return true;
  }

  std::size_t long_lines = 0;
  for (const auto line : lines) {
    if (line.size() > 500) {
      ++long_lines;
    }
    if (core::strip(line).size() > 300) {
      const auto spaces = static_cast<double>(core::count_char(line, ' '));
      if (spaces < static_cast<double>(line.size()) / 20.0) {
        return true;
      }
    }
  }

  return static_cast<double>(long_lines) > 0.2 * static_cast<double>(lines.size());
}

ExclusionReason classify_section(const std::string_view section_text) {
  if (is_binary_section(section_text)) {
    return ExclusionReason::kBinary;
  }

  const auto path = diff::extract_file_path(section_text);
  if (!path.has_value()) {
    return ExclusionReason::kNone;
  }

  if (has_minified_extension(*path)) {
    return ExclusionReason::kMinifiedExtension;
  }
  if (is_in_build_directory(*path)) {
    return ExclusionReason::kBuildDirectory;
  }
  if (is_lockfile_or_generated(*path)) {
    return ExclusionReason::kLockfileOrGenerated;
  }
  if (is_minified_content(section_text)) {
    return ExclusionReason::kMinifiedContent;
  }
  return ExclusionReason::kNone;
}

std::string summarize_excluded_section(const std::string_view section_text,
                                       const ExclusionReason reason) {
  std::string out;
  bool has_header = false;

  for (const auto line : core::split_lines(section_text)) {
    if (diff::is_hunk_header(line)) {
      break;
    }
    if (line.starts_with(diff::kSectionBoundary)) {
      has_header = true;
    } else if (!line.starts_with("new file") && !line.starts_with("deleted file") &&
               !line.starts_with("index ")) {
      continue;
    }
    out.append(line);
    out.push_back('\n');
  }

  if (!has_header) {
    return "";
  }
  out.append(summary_tag(reason));
  out.push_back('\n');
  return out;
}

}  // namespace diffbudget::filtering
