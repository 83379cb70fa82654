#pragma once

#include <string>
#include <string_view>

namespace diffbudget::tokenization {

/// Interface for token counting (the tokenizer port)
///
/// Contract:
/// - Empty text counts as 0
/// - Never throws; implementations recover internally and fall back to approximate_tokens()
/// - Referentially transparent for a given (text, model) pair
class ITokenCounter {
 public:
  virtual ~ITokenCounter() = default;

  /// Count tokens of `text` as the tokenizer for `model` would
  /// @param text Arbitrary text (diff sections, summaries, whole diffs)
  /// @param model Model identifier, optionally prefixed by "provider:"
  [[nodiscard]] virtual int count_tokens(const std::string& text,
                                         const std::string& model) const = 0;

  /// Stable name of the counting scheme; counters with equal ids count identically.
  [[nodiscard]] virtual std::string counter_id() const = 0;
};

/// Character-length approximation: len / 4, saturating at INT_MAX.
[[nodiscard]] int approximate_tokens(std::string_view text);

}  // namespace diffbudget::tokenization
