#include "preprocess_logic.h"

#include "diffbudget/filtering/exclusion.h"
#include "diffbudget/preprocess/preprocessor.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace {

nlohmann::json report_to_json(const diffbudget::preprocess::PreprocessReport& report) {
  nlohmann::json j;
  j["path"] = diffbudget::preprocess::preprocess_path_to_string(report.path);
  j["initial_tokens"] = report.initial_tokens;
  j["section_count"] = report.section_count;
  j["workers_used"] = report.workers_used;

  nlohmann::json exclusions = nlohmann::json::array();
  for (const auto& record : report.exclusions) {
    nlohmann::json entry;
    entry["index"] = record.index;
    entry["file_path"] = record.file_path.has_value() ? nlohmann::json(*record.file_path)
                                                      : nlohmann::json(nullptr);
    entry["reason"] = diffbudget::filtering::exclusion_reason_to_string(record.reason);
    exclusions.push_back(entry);
  }
  j["exclusions"] = exclusions;

  if (report.truncation.has_value()) {
    const auto& truncation = *report.truncation;
    nlohmann::json t;
    t["included_paths"] = truncation.included_paths;
    t["skipped_paths"] = truncation.skipped_paths;
    t["total_sections"] = truncation.total_sections;
    t["section_tokens"] = truncation.section_tokens;
    t["token_count"] = truncation.token_count;
    t["truncated_section"] = truncation.truncated_section;
    t["fast_path"] = truncation.fast_path;
    j["truncation"] = t;
  } else {
    j["truncation"] = nullptr;
  }

  j["output"] = report.output;
  return j;
}

}  // namespace

int execute_preprocess(const std::string& diff, const diffbudget::config::PreprocessConfig& config,
                       const diffbudget::tokenization::ITokenCounter& counter,
                       diffbudget::cache::IPreprocessCache* cache, diffbudget::core::IClock& clock,
                       const bool json_output, const bool verbose) {
  diffbudget::preprocess::Preprocessor preprocessor(
      counter, diffbudget::config::to_preprocess_options(config));
  if (cache != nullptr) {
    preprocessor.attach_cache(*cache, clock);
  }

  const auto report = preprocessor.run(diff, config.token_limit);

  if (verbose) {
    for (const auto& record : report.exclusions) {
      std::cerr << diffbudget::filtering::exclusion_reason_description(record.reason) << ": "
                << record.file_path.value_or("(unknown)") << "\n";
    }
    std::cerr << "Preprocess path: "
              << diffbudget::preprocess::preprocess_path_to_string(report.path)
              << ", initial tokens: " << report.initial_tokens
              << ", sections: " << report.section_count << "\n";
    if (report.truncation.has_value()) {
      std::cerr << "Included " << report.truncation->included_texts.size() << " of "
                << report.truncation->total_sections << " sections, "
                << report.truncation->token_count << "/" << config.token_limit << " tokens\n";
    }
  }

  if (json_output) {
    std::cout << report_to_json(report).dump(2) << "\n";
  } else {
    std::cout << report.output;
  }
  return 0;
}
