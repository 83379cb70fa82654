#include "diffbudget/tokenization/encoding_token_counter.h"

#include <algorithm>
#include <array>
#include <climits>
#include <cmath>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace diffbudget::tokenization {

namespace {

bool is_letter(const char ch) {
  const auto byte = static_cast<unsigned char>(ch);
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') || byte >= 0x80;
}

bool is_digit(const char ch) {
  return ch >= '0' && ch <= '9';
}

bool is_whitespace(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

std::size_t pieces(const std::size_t length, const double width) {
  return static_cast<std::size_t>(std::ceil(static_cast<double>(length) / width));
}

const std::array<EncodingProfile, 3>& registry() {
  static const std::array<EncodingProfile, 3> profiles = {{
      {"cl100k_base", 5.0, 3, 2.0, 8.0},
      {"o200k_base", 6.0, 3, 2.0, 16.0},
      {"p50k_base", 4.0, 3, 1.5, 4.0},
  }};
  return profiles;
}

}  // namespace

Encoding::Encoding(EncodingProfile profile) : profile_(std::move(profile)) {}

int Encoding::count(const std::string_view text) const {
  std::size_t tokens = 0;
  std::size_t i = 0;
  const std::size_t n = text.size();

  while (i < n) {
    const char ch = text[i];
    const std::size_t start = i;

    if (is_letter(ch) || (ch == ' ' && i + 1 < n && is_letter(text[i + 1]))) {
      if (ch == ' ') {
        ++i;
      }
      const std::size_t letters_start = i;
      while (i < n && is_letter(text[i])) {
        ++i;
      }
      tokens += pieces(i - letters_start, profile_.word_width);
    } else if (is_digit(ch)) {
      while (i < n && is_digit(text[i])) {
        ++i;
      }
      tokens += pieces(i - start, static_cast<double>(profile_.number_chunk));
    } else if (is_whitespace(ch)) {
      while (i < n && is_whitespace(text[i])) {
        // A single space directly before a word belongs to that word.
        if (text[i] == ' ' && i > start && i + 1 < n && is_letter(text[i + 1])) {
          break;
        }
        ++i;
      }
      tokens += pieces(i - start, profile_.whitespace_width);
    } else {
      while (i < n && !is_letter(text[i]) && !is_digit(text[i]) && !is_whitespace(text[i])) {
        ++i;
      }
      tokens += pieces(i - start, profile_.punctuation_width);
    }
  }

  if (tokens > static_cast<std::size_t>(INT_MAX)) {
    return INT_MAX;
  }
  return static_cast<int>(tokens);
}

EncodingProfile encoding_profile(const std::string_view encoding_name) {
  for (const auto& profile : registry()) {
    if (profile.name == encoding_name) {
      return profile;
    }
  }
  throw std::out_of_range("Unknown encoding: " + std::string{encoding_name});
}

std::string normalize_model_name(const std::string_view model) {
  const std::size_t colon = model.find(':');
  const std::string_view bare = colon == std::string_view::npos ? model : model.substr(colon + 1);

  std::string normalized;
  normalized.reserve(bare.size());
  for (const char ch : bare) {
    normalized.push_back((ch >= 'A' && ch <= 'Z') ? static_cast<char>(ch - 'A' + 'a') : ch);
  }
  return normalized;
}

std::string resolve_encoding_name(const std::string_view normalized_model,
                                  const std::string_view fallback) {
  if (normalized_model.find("claude") != std::string_view::npos) {
    return "cl100k_base";
  }
  if (normalized_model.starts_with("gpt-4o") || normalized_model.starts_with("o1") ||
      normalized_model.starts_with("o3") || normalized_model.starts_with("o4")) {
    return "o200k_base";
  }
  if (normalized_model.starts_with("gpt-4") || normalized_model.starts_with("gpt-3.5")) {
    return "cl100k_base";
  }
  if (normalized_model.starts_with("text-davinci") ||
      normalized_model.starts_with("code-davinci")) {
    return "p50k_base";
  }
  return std::string{fallback};
}

EncodingTokenCounter::EncodingTokenCounter(std::string default_encoding)
    : default_encoding_(std::move(default_encoding)) {}

std::shared_ptr<const Encoding> EncodingTokenCounter::encoding_for(
    const std::string& model) const {
  const std::string key = normalize_model_name(model);

  {
    std::shared_lock lock(mutex_);
    const auto it = encodings_.find(key);
    if (it != encodings_.end()) {
      return it->second;
    }
  }

  // Build outside the lock; a racing caller produces an equivalent encoding.
  auto encoding = std::make_shared<const Encoding>(
      encoding_profile(resolve_encoding_name(key, default_encoding_)));

  std::unique_lock lock(mutex_);
  return encodings_.emplace(key, std::move(encoding)).first->second;
}

int EncodingTokenCounter::count_tokens(const std::string& text, const std::string& model) const {
  if (text.empty()) {
    return 0;
  }
  try {
    return encoding_for(model)->count(text);
  } catch (const std::exception&) {
    return approximate_tokens(text);
  }
}

std::string EncodingTokenCounter::counter_id() const {
  return "encoding:" + default_encoding_;
}

std::size_t EncodingTokenCounter::cached_encoding_count() const {
  std::shared_lock lock(mutex_);
  return encodings_.size();
}

}  // namespace diffbudget::tokenization
