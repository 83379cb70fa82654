#pragma once

#include "diffbudget/tokenization/token_counter.h"

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace diffbudget::tokenization {

inline constexpr std::string_view kDefaultEncoding = "cl100k_base";

/// Parameters of a byte-pair-style encoding, as far as counting needs them.
struct EncodingProfile {
  std::string name;
  double word_width = 5.0;         // characters per token inside a word piece
  std::size_t number_chunk = 3;    // digits per token
  double punctuation_width = 2.0;  // characters per token inside a punctuation run
  double whitespace_width = 8.0;   // characters per token inside a whitespace run
};

/// Encoding counts tokens by pre-tokenizing text into word, number, punctuation and
/// whitespace pieces and charging each piece ceil(length / width) tokens.
/// A word piece absorbs one preceding space, like GPT-style encoders.
class Encoding {
 public:
  explicit Encoding(EncodingProfile profile);

  [[nodiscard]] const std::string& name() const { return profile_.name; }
  [[nodiscard]] int count(std::string_view text) const;

 private:
  EncodingProfile profile_;
};

/// Look up a registered encoding by name (cl100k_base, o200k_base, p50k_base).
/// @throws std::out_of_range for unknown names
[[nodiscard]] EncodingProfile encoding_profile(std::string_view encoding_name);

/// "anthropic:claude-3-haiku" -> "claude-3-haiku"; lowercased.
[[nodiscard]] std::string normalize_model_name(std::string_view model);

/// Encoding name for a normalized model, or `fallback` when the model is not recognized.
[[nodiscard]] std::string resolve_encoding_name(std::string_view normalized_model,
                                                std::string_view fallback = kDefaultEncoding);

/// Token counter backed by per-model encodings.
///
/// Encodings are memoized by normalized model name. Lookups take a shared lock and
/// population takes an exclusive lock; concurrent callers racing to populate the same model
/// build equivalent encodings and the first insert wins.
/// Any failure while resolving or counting falls back to approximate_tokens().
class EncodingTokenCounter final : public ITokenCounter {
 public:
  /// @param default_encoding Encoding used for unrecognized models
  explicit EncodingTokenCounter(std::string default_encoding = std::string{kDefaultEncoding});

  [[nodiscard]] int count_tokens(const std::string& text, const std::string& model) const override;

  /// "encoding:<default encoding>"
  [[nodiscard]] std::string counter_id() const override;

  /// Number of memoized encodings (one per distinct normalized model).
  [[nodiscard]] std::size_t cached_encoding_count() const;

 private:
  [[nodiscard]] std::shared_ptr<const Encoding> encoding_for(const std::string& model) const;

  std::string default_encoding_;
  mutable std::shared_mutex mutex_;
  mutable std::unordered_map<std::string, std::shared_ptr<const Encoding>> encodings_;
};

}  // namespace diffbudget::tokenization
