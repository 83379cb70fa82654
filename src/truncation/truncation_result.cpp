#include "diffbudget/truncation/truncation_result.h"

namespace diffbudget::truncation {

std::string render_truncation(const std::vector<std::string>& included_texts,
                              const std::optional<std::string>& skipped_summary,
                              const std::optional<std::string>& usage_summary) {
  std::string out;
  for (const auto& text : included_texts) {
    out += text;
  }

  auto append_line = [&out](const std::string& line) {
    if (!out.empty() && out.back() != '\n') {
      out.push_back('\n');
    }
    out += line;
    out.push_back('\n');
  };
  if (skipped_summary.has_value()) {
    append_line(*skipped_summary);
  }
  if (usage_summary.has_value()) {
    append_line(*usage_summary);
  }
  return out;
}

std::string TruncationResult::render() const {
  return render_truncation(included_texts, skipped_summary, usage_summary);
}

}  // namespace diffbudget::truncation
