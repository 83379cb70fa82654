#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace diffbudget::diff {

// Literal boundary that starts every per-file section of a git diff.
inline constexpr std::string_view kSectionBoundary = "diff --git ";

enum class ChangeKind {
  kModified,
  kAdded,
  kDeleted,
  kRenamed,
  kUnknown,
};

// DiffSection is one file's worth of diff text plus metadata derived from it.
// Produced once by parse_section and treated as read-only afterwards; later stages key their
// own values (score, token count) by section instead of mutating it.
struct DiffSection {
  std::string raw_text;
  std::optional<std::string> file_path;  // "b/" side of the header; absent for malformed input
  ChangeKind change_kind{ChangeKind::kUnknown};
  std::size_t addition_count{0};
  std::size_t deletion_count{0};

  [[nodiscard]] std::size_t total_changes() const { return addition_count + deletion_count; }
};

// parse_section derives path, change kind and +/- counts from one section's text.
[[nodiscard]] DiffSection parse_section(std::string raw_text);

// extract_file_path returns the "b/" path of the first `diff --git a/X b/Y` line, if any.
// Quoted headers (`diff --git "a/x y" "b/x y"`) are unquoted.
[[nodiscard]] std::optional<std::string> extract_file_path(std::string_view section_text);

// Only markers in the extended header (before the first hunk) are considered.
[[nodiscard]] ChangeKind detect_change_kind(std::string_view section_text);

[[nodiscard]] const char* change_kind_to_string(ChangeKind kind);

// is_addition_line / is_deletion_line: a single leading '+' / '-' not followed by another,
// which excludes the "+++ b/..." and "--- a/..." file markers.
[[nodiscard]] bool is_addition_line(std::string_view line);
[[nodiscard]] bool is_deletion_line(std::string_view line);

[[nodiscard]] inline bool is_hunk_header(const std::string_view line) {
  return line.starts_with("@@");
}

}  // namespace diffbudget::diff
