#pragma once

#include "diffbudget/scoring/importance_scorer.h"
#include "diffbudget/tokenization/token_counter.h"
#include "diffbudget/truncation/truncation_result.h"

#include <cstddef>
#include <string>
#include <vector>

namespace diffbudget::truncation {

struct TruncationOptions {
  std::string model = "anthropic:claude-3-haiku-latest";
  int include_all_threshold = 1000;  // budgets at or above try one whole-output count first
  int skip_summary_reserve = 200;
  int usage_summary_reserve = 100;
  std::size_t max_skipped_listed = 5;
};

/// Greedy, score-ordered selection of whole sections under a token budget.
///
/// Walks sections by descending score (stable, so input order breaks ties), drops later
/// sections whose path was already seen, and admits each section whose count fits the
/// remaining budget ("skip and keep scanning"). The selection and every summary line are
/// confirmed against an exact count of the rendered output; when the selection overshoots
/// (a tokenizer that is not additive across sections) each admission is re-checked, so
/// result.token_count <= token_limit holds for any tokenizer.
class BudgetTruncator {
 public:
  explicit BudgetTruncator(const tokenization::ITokenCounter& counter,
                           TruncationOptions options = {});

  [[nodiscard]] TruncationResult truncate(const std::vector<scoring::ScoredSection>& sections,
                                          int token_limit) const;

  [[nodiscard]] const TruncationOptions& options() const { return options_; }

 private:
  [[nodiscard]] int count(const std::string& text) const;

  const tokenization::ITokenCounter& counter_;
  TruncationOptions options_;
};

/// "[Skipped files due to token limits: a, b and 3 more]" listing the first `listed` paths.
[[nodiscard]] std::string format_skipped_summary(const std::vector<std::string>& skipped_paths,
                                                 std::size_t listed);

/// "[Summary: Showing K of T changed files (R/L tokens used), prioritized by importance.]"
[[nodiscard]] std::string format_usage_summary(std::size_t included, std::size_t total,
                                               int tokens_used, int token_limit);

}  // namespace diffbudget::truncation
