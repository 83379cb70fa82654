#pragma once

#include "diffbudget/filtering/exclusion.h"

#include <string>
#include <string_view>

namespace diffbudget::filtering {

// Section classifier: decides whether a diff section is noise that should be dropped before
// scoring. All functions are pure and safe to call concurrently.
//
// Check order (first match wins):
//   1. binary marker
//   2. minified-by-extension     (path required)
//   3. build directory           (path required)
//   4. lockfile / generated file (path required)
//   5. minified-by-content       (path required)
// Sections without an extractable path only go through check 1.
[[nodiscard]] ExclusionReason classify_section(std::string_view section_text);

[[nodiscard]] inline bool should_exclude(const std::string_view section_text) {
  return classify_section(section_text) != ExclusionReason::kNone;
}

// Individual checks, exposed for reuse and testing.
[[nodiscard]] bool is_binary_section(std::string_view section_text);
[[nodiscard]] bool has_minified_extension(std::string_view file_path);
[[nodiscard]] bool is_in_build_directory(std::string_view file_path);
[[nodiscard]] bool is_lockfile_or_generated(std::string_view file_path);

// Heuristic minification test, exclude if ANY holds:
//   (a) fewer than 10 lines and more than 1000 characters overall
//   (b) exactly one line, longer than 200 characters
//   (c) a line with stripped length > 300 and fewer than len/20 spaces
//   (d) more than 20% of lines longer than 500 characters
[[nodiscard]] bool is_minified_content(std::string_view content);

// summarize_excluded_section keeps the identifying header lines of an excluded section
// (diff --git, new/deleted file, index) and appends a change tag such as
// "[Binary file change]". Returns "" when the section has no recognizable header.
[[nodiscard]] std::string summarize_excluded_section(std::string_view section_text,
                                                     ExclusionReason reason);

}  // namespace diffbudget::filtering
