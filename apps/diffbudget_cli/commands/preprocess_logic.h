#pragma once

#include "diffbudget/cache/preprocess_cache.h"
#include "diffbudget/config/preprocess_config.h"
#include "diffbudget/core/clock.h"
#include "diffbudget/tokenization/token_counter.h"

#include <string>

// execute_preprocess: run the full preprocessor over `diff` and print the result.
// Takes only interface types; the caller decides which cache backend (if any) and which
// tokenizer to use. `cache` may be null.
// Output goes to stdout (the processed diff, or a JSON report with --json); --verbose
// diagnostics go to stderr.
int execute_preprocess(const std::string& diff, const diffbudget::config::PreprocessConfig& config,
                       const diffbudget::tokenization::ITokenCounter& counter,
                       diffbudget::cache::IPreprocessCache* cache, diffbudget::core::IClock& clock,
                       bool json_output, bool verbose);
