#pragma once

#include "diffbudget/filtering/exclusion.h"

#include <cstddef>
#include <string>
#include <vector>

namespace diffbudget::filtering {

// Inputs this small are classified on the calling thread.
inline constexpr std::size_t kSequentialThreshold = 3;

// Upper bound on worker threads regardless of configuration.
inline constexpr std::size_t kMaxFilterWorkers = 4;

struct FilterOptions {
  std::size_t max_workers = kMaxFilterWorkers;
};

struct ExcludedSection {
  std::size_t index = 0;  // position in the input sequence
  ExclusionReason reason = ExclusionReason::kNone;
  std::string text;
};

// FilterOutcome partitions the input: `kept` preserves input order, `excluded` lists the
// dropped sections (also in input order) with the check that dropped them.
struct FilterOutcome {
  std::vector<std::string> kept;
  std::vector<ExcludedSection> excluded;
  std::size_t workers_used = 1;
};

/// Classify every section and keep those the classifier accepts.
///
/// Up to kSequentialThreshold sections are processed sequentially. Larger inputs use a
/// fixed pool of min(max_workers, hardware threads, kMaxFilterWorkers, n) threads that pull
/// indices from a shared counter and write verdicts by input index, so the result is
/// identical to the sequential run. Thread creation failure falls back to sequential.
[[nodiscard]] FilterOutcome filter_sections(std::vector<std::string> sections,
                                            const FilterOptions& options = {});

/// Verdicts only, one per input section, in input order.
[[nodiscard]] std::vector<ExclusionReason> classify_sections(
    const std::vector<std::string>& sections, const FilterOptions& options = {},
    std::size_t* workers_used = nullptr);

}  // namespace diffbudget::filtering
