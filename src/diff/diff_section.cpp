#include "diffbudget/diff/diff_section.h"

#include "diffbudget/core/text.h"

#include <vector>

namespace diffbudget::diff {

namespace {

std::string_view trim_cr(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::optional<std::string> path_from_header(std::string_view rest) {
  rest = trim_cr(rest);

  // Quoted form: "a/some path" "b/some path"
  if (!rest.empty() && rest.back() == '"') {
    const std::size_t open = rest.rfind(" \"b/");
    if (open == std::string_view::npos) {
      return std::nullopt;
    }
    const std::string_view quoted = rest.substr(open + 4, rest.size() - open - 5);
    if (quoted.empty()) {
      return std::nullopt;
    }
    return std::string{quoted};
  }

  // Plain form: a/X b/Y. Split on the last " b/" so paths containing spaces survive.
  if (!rest.starts_with("a/")) {
    return std::nullopt;
  }
  const std::size_t b_pos = rest.rfind(" b/");
  if (b_pos == std::string_view::npos) {
    return std::nullopt;
  }
  const std::string_view path = rest.substr(b_pos + 3);
  if (path.empty()) {
    return std::nullopt;
  }
  return std::string{path};
}

}  // namespace

std::optional<std::string> extract_file_path(const std::string_view section_text) {
  for (const auto line : core::split_lines(section_text)) {
    if (line.starts_with(kSectionBoundary)) {
      return path_from_header(line.substr(kSectionBoundary.size()));
    }
  }
  return std::nullopt;
}

ChangeKind detect_change_kind(const std::string_view section_text) {
  bool saw_header = false;
  bool renamed = false;

  for (const auto raw_line : core::split_lines(section_text)) {
    const std::string_view line = trim_cr(raw_line);
    if (is_hunk_header(line)) {
      break;
    }
    if (line.starts_with(kSectionBoundary)) {
      saw_header = true;
    } else if (line.starts_with("new file mode")) {
      return ChangeKind::kAdded;
    } else if (line.starts_with("deleted file mode")) {
      return ChangeKind::kDeleted;
    } else if (line.starts_with("rename from") || line.starts_with("rename to")) {
      renamed = true;
    }
  }

  if (renamed) {
    return ChangeKind::kRenamed;
  }
  return saw_header ? ChangeKind::kModified : ChangeKind::kUnknown;
}

bool is_addition_line(const std::string_view line) {
  return !line.empty() && line[0] == '+' && (line.size() == 1 || line[1] != '+');
}

bool is_deletion_line(const std::string_view line) {
  return !line.empty() && line[0] == '-' && (line.size() == 1 || line[1] != '-');
}

DiffSection parse_section(std::string raw_text) {
  DiffSection section;
  section.file_path = extract_file_path(raw_text);
  section.change_kind = detect_change_kind(raw_text);
  if (!section.file_path.has_value()) {
    section.change_kind = ChangeKind::kUnknown;
  }

  for (const auto line : core::split_lines(raw_text)) {
    if (is_addition_line(line)) {
      ++section.addition_count;
    } else if (is_deletion_line(line)) {
      ++section.deletion_count;
    }
  }

  section.raw_text = std::move(raw_text);
  return section;
}

const char* change_kind_to_string(const ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kModified:
      return "modified";
    case ChangeKind::kAdded:
      return "added";
    case ChangeKind::kDeleted:
      return "deleted";
    case ChangeKind::kRenamed:
      return "renamed";
    case ChangeKind::kUnknown:
      break;
  }
  return "unknown";
}

}  // namespace diffbudget::diff
