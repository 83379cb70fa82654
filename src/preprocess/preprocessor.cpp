#include "diffbudget/preprocess/preprocessor.h"

#include "diffbudget/diff/diff_section.h"
#include "diffbudget/diff/section_splitter.h"
#include "diffbudget/filtering/parallel_filter.h"
#include "diffbudget/filtering/section_classifier.h"
#include "diffbudget/scoring/importance_scorer.h"
#include "diffbudget/truncation/budget_truncator.h"

#include <utility>

namespace diffbudget::preprocess {

const char* preprocess_path_to_string(const PreprocessPath path) {
  switch (path) {
    case PreprocessPath::kEmpty:
      return "empty";
    case PreprocessPath::kCached:
      return "cached";
    case PreprocessPath::kFilterOnly:
      return "filter_only";
    case PreprocessPath::kFull:
      break;
  }
  return "full";
}

Preprocessor::Preprocessor(const tokenization::ITokenCounter& counter, PreprocessOptions options)
    : counter_(counter), options_(std::move(options)) {}

void Preprocessor::attach_cache(cache::IPreprocessCache& cache, core::IClock& clock) {
  cache_ = &cache;
  clock_ = &clock;
}

int Preprocessor::count(const std::string& text) const {
  return counter_.count_tokens(text, options_.model);
}

PreprocessReport Preprocessor::run(const std::string_view diff_text, const int token_limit) const {
  PreprocessReport report;
  if (diff_text.empty() || token_limit <= 0) {
    return report;
  }

  std::string cache_key;
  if (cache_ != nullptr) {
    cache_key = cache::make_cache_key(
        cache::CacheKeyFields{counter_.counter_id(), options_.model, token_limit,
                              options_.include_all_threshold, options_.cheap_path_ratio,
                              options_.summarize_excluded},
        diff_text);
    if (auto hit = cache_->get(cache_key)) {
      report.path = PreprocessPath::kCached;
      report.output = std::move(hit->output);
      return report;
    }
  }

  const std::string whole{diff_text};
  report.initial_tokens = count(whole);

  auto sections = diff::split_diff(diff_text);
  report.section_count = sections.size();

  filtering::FilterOptions filter_options;
  filter_options.max_workers = options_.max_workers;
  auto filtered = filtering::filter_sections(std::move(sections), filter_options);
  report.workers_used = filtered.workers_used;
  for (const auto& excluded : filtered.excluded) {
    report.exclusions.push_back(
        ExclusionRecord{excluded.index, diff::extract_file_path(excluded.text), excluded.reason});
  }

  const bool cheap = static_cast<double>(report.initial_tokens) <=
                     options_.cheap_path_ratio * static_cast<double>(token_limit);
  if (cheap) {
    std::string output;
    std::size_t kept_index = 0;
    std::size_t excluded_index = 0;
    // Re-interleave in input order so excluded stubs sit where their sections were.
    for (std::size_t i = 0; i < report.section_count; ++i) {
      if (excluded_index < filtered.excluded.size() &&
          filtered.excluded[excluded_index].index == i) {
        const auto& excluded = filtered.excluded[excluded_index++];
        if (options_.summarize_excluded) {
          output += filtering::summarize_excluded_section(excluded.text, excluded.reason);
        }
      } else {
        output += filtered.kept[kept_index++];
      }
    }

    // Stubs can outweigh what they replace; fall through to the full path if so.
    if (count(output) <= token_limit) {
      report.path = PreprocessPath::kFilterOnly;
      report.output = std::move(output);
      if (cache_ != nullptr) {
        cache_->put(cache_key, cache::CachedOutput{report.output, clock_->now_epoch_seconds()});
      }
      return report;
    }
  }

  auto scored = scoring::score_sections(std::move(filtered.kept));

  truncation::TruncationOptions truncation_options;
  truncation_options.model = options_.model;
  truncation_options.include_all_threshold = options_.include_all_threshold;
  const truncation::BudgetTruncator truncator(counter_, truncation_options);

  report.path = PreprocessPath::kFull;
  report.truncation = truncator.truncate(scored, token_limit);
  report.output = report.truncation->render();

  if (cache_ != nullptr) {
    cache_->put(cache_key, cache::CachedOutput{report.output, clock_->now_epoch_seconds()});
  }
  return report;
}

std::string preprocess(const std::string_view diff_text, const int token_limit,
                       const std::string& model, const tokenization::ITokenCounter& counter) {
  PreprocessOptions options;
  options.model = model;
  return Preprocessor(counter, std::move(options)).run(diff_text, token_limit).output;
}

}  // namespace diffbudget::preprocess
