#include "diffbudget/truncation/section_truncator.h"

#include "diffbudget/core/text.h"
#include "diffbudget/diff/diff_section.h"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace diffbudget::truncation {

namespace {

int line_rank(const std::string_view line) {
  if (line.starts_with('+')) {
    return kAdditionRank;
  }
  if (line.starts_with('-')) {
    return kDeletionRank;
  }
  if (diff::is_hunk_header(line)) {
    return kHunkHeaderRank;
  }
  return kContextRank;
}

// Kept lines in document order, each newline-terminated, optionally followed by the marker.
std::string render_kept(const std::vector<std::string_view>& lines, std::vector<std::size_t> kept,
                        const bool with_marker) {
  std::sort(kept.begin(), kept.end());
  std::string out;
  for (const std::size_t index : kept) {
    out.append(lines[index]);
    out.push_back('\n');
  }
  if (with_marker) {
    out.append(kTruncationMarker);
    out.push_back('\n');
  }
  return out;
}

struct LineCut {
  std::string text;
  int tokens = 0;
};

// One selection pass under `budget`. With `with_marker` the caller has already taken the
// marker's cost out of `budget`; the result is verified against `token_limit`.
LineCut cut_lines(const std::vector<std::string_view>& lines, const std::vector<int>& line_tokens,
                  const std::optional<std::size_t> hunk_index, const int budget,
                  const int token_limit, const bool with_marker,
                  const tokenization::ITokenCounter& counter, const std::string& model) {
  int header_tokens = 0;
  bool header_fits = false;
  if (hunk_index.has_value()) {
    std::string header;
    for (std::size_t i = 0; i <= *hunk_index; ++i) {
      header.append(lines[i]);
      header.push_back('\n');
    }
    header_tokens = counter.count_tokens(header, model);
    header_fits = header_tokens <= budget;
  }

  // Admission order doubles as removal order: the last admitted line is dropped first.
  std::vector<std::size_t> kept;
  if (!header_fits) {
    int running = 0;
    for (std::size_t i = 0; i < lines.size(); ++i) {
      if (running + line_tokens[i] > budget) {
        break;
      }
      kept.push_back(i);
      running += line_tokens[i];
    }
  } else {
    for (std::size_t i = 0; i <= *hunk_index; ++i) {
      kept.push_back(i);
    }

    std::vector<std::pair<int, std::size_t>> candidates;
    for (std::size_t i = *hunk_index + 1; i < lines.size(); ++i) {
      if (!core::is_blank(lines[i])) {
        candidates.emplace_back(line_rank(lines[i]), i);
      }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    int running = header_tokens;
    for (const auto& candidate : candidates) {
      const std::size_t index = candidate.second;
      if (running + line_tokens[index] <= budget) {
        kept.push_back(index);
        running += line_tokens[index];
      }
    }
  }

  const bool marked = with_marker && kept.size() < lines.size();
  std::string out = render_kept(lines, kept, marked);
  int tokens = counter.count_tokens(out, model);

  // Per-line estimates need not add up to the whole; trim until the exact count fits.
  while (tokens > token_limit && !kept.empty()) {
    const int excess = tokens - token_limit;
    int removed = 0;
    do {
      removed += std::max(1, line_tokens[kept.back()]);
      kept.pop_back();
    } while (removed < excess && !kept.empty());
    out = render_kept(lines, kept, with_marker);
    tokens = counter.count_tokens(out, model);
  }

  if (kept.empty() || tokens > token_limit) {
    return {};
  }
  return {std::move(out), tokens};
}

}  // namespace

SectionTruncation truncate_section(const std::string_view section_text, const int token_limit,
                                   const tokenization::ITokenCounter& counter,
                                   const std::string& model) {
  SectionTruncation result;
  if (token_limit <= 0 || section_text.empty()) {
    return result;
  }

  const std::string whole{section_text};
  const int whole_tokens = counter.count_tokens(whole, model);
  if (whole_tokens <= token_limit) {
    result.text = whole;
    result.token_count = whole_tokens;
    return result;
  }

  auto lines = core::split_lines(section_text);
  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  std::vector<int> line_tokens;
  line_tokens.reserve(lines.size());
  for (const auto line : lines) {
    line_tokens.push_back(counter.count_tokens(std::string{line}, model));
  }

  std::optional<std::size_t> hunk_index;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (diff::is_hunk_header(lines[i])) {
      hunk_index = i;
      break;
    }
  }

  std::string marker_line{kTruncationMarker};
  marker_line.push_back('\n');
  const int marker_tokens = std::max(1, counter.count_tokens(marker_line, model));

  LineCut cut;
  if (marker_tokens < token_limit) {
    cut = cut_lines(lines, line_tokens, hunk_index, token_limit - marker_tokens, token_limit,
                    true, counter, model);
  }
  // Budgets too small for the marker and a line keep the leading lines unmarked.
  if (cut.text.empty()) {
    cut = cut_lines(lines, line_tokens, hunk_index, token_limit, token_limit, false, counter,
                    model);
  }

  result.text = std::move(cut.text);
  result.token_count = cut.tokens;
  result.truncated = true;
  return result;
}

}  // namespace diffbudget::truncation
