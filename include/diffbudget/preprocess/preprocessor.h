#pragma once

#include "diffbudget/cache/preprocess_cache.h"
#include "diffbudget/core/clock.h"
#include "diffbudget/filtering/exclusion.h"
#include "diffbudget/tokenization/token_counter.h"
#include "diffbudget/truncation/truncation_result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diffbudget::preprocess {

inline constexpr int kDefaultTokenLimit = 6000;
inline constexpr const char* kDefaultModel = "anthropic:claude-3-haiku-latest";

struct PreprocessOptions {
  std::string model = kDefaultModel;
  std::size_t max_workers = 4;
  int include_all_threshold = 1000;
  double cheap_path_ratio = 0.8;  // whole-diff count at or below ratio * limit: filter only
  bool summarize_excluded = false;
};

enum class PreprocessPath {
  kEmpty,       // empty input or non-positive budget
  kCached,      // served from the result cache
  kFilterOnly,  // small diff: noise removed, nothing truncated
  kFull,        // split, filter, score, truncate
};

[[nodiscard]] const char* preprocess_path_to_string(PreprocessPath path);

struct ExclusionRecord {
  std::size_t index = 0;
  std::optional<std::string> file_path;
  filtering::ExclusionReason reason = filtering::ExclusionReason::kNone;
};

// PreprocessReport is everything a caller may want to know about one run.
struct PreprocessReport {
  PreprocessPath path = PreprocessPath::kEmpty;
  int initial_tokens = 0;
  std::size_t section_count = 0;
  std::size_t workers_used = 0;
  std::vector<ExclusionRecord> exclusions;
  std::optional<truncation::TruncationResult> truncation;  // set on kFull only
  std::string output;
};

/// Preprocessor: split -> filter -> score -> truncate, with a cheap path for small diffs.
///
/// The tokenizer and optional cache are borrowed and must outlive the preprocessor.
/// run() never throws for well-formed arguments and never returns more than token_limit tokens
/// on the kFull path.
class Preprocessor {
 public:
  explicit Preprocessor(const tokenization::ITokenCounter& counter,
                        PreprocessOptions options = {});

  // Consult and fill `cache`, stamping entries with `clock`.
  void attach_cache(cache::IPreprocessCache& cache, core::IClock& clock);

  [[nodiscard]] PreprocessReport run(std::string_view diff_text, int token_limit) const;

  [[nodiscard]] const PreprocessOptions& options() const { return options_; }

 private:
  [[nodiscard]] int count(const std::string& text) const;

  const tokenization::ITokenCounter& counter_;
  PreprocessOptions options_;
  cache::IPreprocessCache* cache_ = nullptr;
  core::IClock* clock_ = nullptr;
};

/// One-shot convenience over Preprocessor with default options and no cache.
[[nodiscard]] std::string preprocess(std::string_view diff_text, int token_limit,
                                     const std::string& model,
                                     const tokenization::ITokenCounter& counter);

}  // namespace diffbudget::preprocess
