#include "diffbudget/filtering/parallel_filter.h"

#include "diffbudget/filtering/section_classifier.h"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>
#include <utility>

namespace diffbudget::filtering {

namespace {

void classify_sequential(const std::vector<std::string>& sections,
                         std::vector<ExclusionReason>& verdicts) {
  for (std::size_t i = 0; i < sections.size(); ++i) {
    verdicts[i] = classify_section(sections[i]);
  }
}

std::size_t worker_count(const std::size_t max_workers, const std::size_t section_count) {
  std::size_t hardware = std::thread::hardware_concurrency();
  if (hardware == 0) {
    hardware = 1;
  }
  return std::max<std::size_t>(
      1, std::min({max_workers, hardware, kMaxFilterWorkers, section_count}));
}

}  // namespace

std::vector<ExclusionReason> classify_sections(const std::vector<std::string>& sections,
                                               const FilterOptions& options,
                                               std::size_t* workers_used) {
  std::vector<ExclusionReason> verdicts(sections.size(), ExclusionReason::kNone);
  if (workers_used != nullptr) {
    *workers_used = 1;
  }

  const std::size_t workers = worker_count(options.max_workers, sections.size());
  if (sections.size() <= kSequentialThreshold || workers <= 1) {
    classify_sequential(sections, verdicts);
    return verdicts;
  }

  std::atomic<std::size_t> next_index{0};
  auto worker = [&sections, &verdicts, &next_index] {
    while (true) {
      const std::size_t i = next_index.fetch_add(1, std::memory_order_relaxed);
      if (i >= sections.size()) {
        return;
      }
      verdicts[i] = classify_section(sections[i]);
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  try {
    for (std::size_t i = 0; i < workers; ++i) {
      pool.emplace_back(worker);
    }
  } catch (const std::system_error&) {
    // Threads that did start drain the whole counter before exiting.
  }

  for (auto& thread : pool) {
    thread.join();
  }

  if (pool.empty()) {
    classify_sequential(sections, verdicts);
    return verdicts;
  }

  if (workers_used != nullptr) {
    *workers_used = pool.size();
  }
  return verdicts;
}

FilterOutcome filter_sections(std::vector<std::string> sections, const FilterOptions& options) {
  FilterOutcome outcome;
  const auto verdicts = classify_sections(sections, options, &outcome.workers_used);

  outcome.kept.reserve(sections.size());
  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (verdicts[i] == ExclusionReason::kNone) {
      outcome.kept.push_back(std::move(sections[i]));
    } else {
      outcome.excluded.push_back(ExcludedSection{i, verdicts[i], std::move(sections[i])});
    }
  }
  return outcome;
}

}  // namespace diffbudget::filtering
