#include "diffbudget/truncation/budget_truncator.h"

#include "diffbudget/truncation/section_truncator.h"

#include <algorithm>
#include <numeric>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace diffbudget::truncation {

namespace {

std::string path_or_unknown(const diff::DiffSection& section) {
  return section.file_path.value_or(kUnknownPath);
}

// Sections are emitted back to back in score order, so each must end its last line.
std::string terminated(const std::string& text) {
  if (text.empty() || text.back() == '\n') {
    return text;
  }
  return text + '\n';
}

}  // namespace

std::string format_skipped_summary(const std::vector<std::string>& skipped_paths,
                                   std::size_t listed) {
  listed = std::min(listed, skipped_paths.size());
  const std::size_t remaining = skipped_paths.size() - listed;

  std::string line = "[Skipped files due to token limits: ";
  if (listed == 0) {
    line += std::to_string(remaining) + (remaining == 1 ? " file" : " files");
  } else {
    for (std::size_t i = 0; i < listed; ++i) {
      if (i > 0) {
        line += ", ";
      }
      line += skipped_paths[i];
    }
    if (remaining > 0) {
      line += " and " + std::to_string(remaining) + " more";
    }
  }
  line += "]";
  return line;
}

std::string format_usage_summary(const std::size_t included, const std::size_t total,
                                 const int tokens_used, const int token_limit) {
  return "[Summary: Showing " + std::to_string(included) + " of " + std::to_string(total) +
         " changed files (" + std::to_string(tokens_used) + "/" + std::to_string(token_limit) +
         " tokens used), prioritized by importance.]";
}

BudgetTruncator::BudgetTruncator(const tokenization::ITokenCounter& counter,
                                 TruncationOptions options)
    : counter_(counter), options_(std::move(options)) {}

int BudgetTruncator::count(const std::string& text) const {
  return counter_.count_tokens(text, options_.model);
}

TruncationResult BudgetTruncator::truncate(const std::vector<scoring::ScoredSection>& sections,
                                           const int token_limit) const {
  TruncationResult result;
  result.total_sections = sections.size();
  if (sections.empty() || token_limit <= 0) {
    return result;
  }

  std::vector<std::size_t> order(sections.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::stable_sort(order.begin(), order.end(), [&sections](std::size_t a, std::size_t b) {
    return sections[a].score > sections[b].score;
  });

  // First occurrence of each path wins; path-less sections are never merged.
  std::vector<std::size_t> candidates;
  candidates.reserve(order.size());
  std::unordered_set<std::string> seen_paths;
  for (const std::size_t index : order) {
    const auto& path = sections[index].section.file_path;
    if (path.has_value() && !seen_paths.insert(*path).second) {
      continue;
    }
    candidates.push_back(index);
  }

  auto include = [&result, &sections](const std::size_t index, std::string text) {
    result.included_texts.push_back(std::move(text));
    result.included_paths.push_back(path_or_unknown(sections[index].section));
  };

  if (token_limit >= options_.include_all_threshold) {
    std::string everything;
    for (const std::size_t index : candidates) {
      everything += terminated(sections[index].section.raw_text);
    }
    const int tokens = count(everything);
    if (tokens <= token_limit) {
      for (const std::size_t index : candidates) {
        include(index, terminated(sections[index].section.raw_text));
      }
      result.fast_path = true;
      result.section_tokens = tokens;
      result.token_count = tokens;
      return result;
    }
  }

  std::vector<std::string> texts;
  std::vector<int> text_tokens;
  texts.reserve(candidates.size());
  text_tokens.reserve(candidates.size());
  for (const std::size_t index : candidates) {
    texts.push_back(terminated(sections[index].section.raw_text));
    text_tokens.push_back(std::max(1, count(texts.back())));
  }

  int running = 0;
  std::vector<std::size_t> admitted;  // positions in `candidates`
  std::vector<std::size_t> skipped;   // section indices

  // Admits by per-section counts. With `confirm_each`, every admission is also checked
  // against an exact count of the output so far.
  auto select = [&](const bool confirm_each) {
    std::string rendered;
    running = 0;
    admitted.clear();
    skipped.clear();
    for (std::size_t i = 0; i < candidates.size(); ++i) {
      if (running + text_tokens[i] <= token_limit &&
          (!confirm_each || count(rendered + texts[i]) <= token_limit)) {
        rendered += texts[i];
        running += text_tokens[i];
        admitted.push_back(i);
        continue;
      }
      skipped.push_back(candidates[i]);
    }
    return rendered;
  };

  // One exact count confirms the whole selection; tokenizers that are not additive across
  // section seams get the per-admission check instead.
  const std::string selected = select(false);
  if (!admitted.empty() && count(selected) > token_limit) {
    select(true);
  }
  for (const std::size_t i : admitted) {
    include(candidates[i], texts[i]);
  }

  // Nothing fit whole: keep a line-level cut of the highest-ranked section.
  if (result.included_texts.empty()) {
    const std::size_t top = candidates.front();
    auto cut = truncate_section(sections[top].section.raw_text, token_limit, counter_,
                                options_.model);
    if (!cut.text.empty()) {
      running = cut.token_count;
      include(top, std::move(cut.text));
      result.truncated_section = true;
      skipped.erase(std::find(skipped.begin(), skipped.end(), top));
    }
  }

  result.section_tokens = running;
  for (const std::size_t index : skipped) {
    result.skipped_paths.push_back(path_or_unknown(sections[index].section));
  }

  if (!skipped.empty() && running + options_.skip_summary_reserve <= token_limit) {
    std::size_t listed = std::min(options_.max_skipped_listed, result.skipped_paths.size());
    while (true) {
      std::string line = format_skipped_summary(result.skipped_paths, listed);
      if (count(render_truncation(result.included_texts, line, std::nullopt)) <= token_limit) {
        result.skipped_summary = std::move(line);
        break;
      }
      if (listed == 0) {
        break;
      }
      --listed;
    }
  }

  if (running + options_.usage_summary_reserve <= token_limit) {
    std::string line = format_usage_summary(result.included_texts.size(), result.total_sections,
                                            running, token_limit);
    if (count(render_truncation(result.included_texts, result.skipped_summary, line)) <=
        token_limit) {
      result.usage_summary = std::move(line);
    }
  }

  result.token_count = count(result.render());
  return result;
}

}  // namespace diffbudget::truncation
