#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace diffbudget::cache {

// Default lifetime of a cached preprocessing result (24 hours).
inline constexpr std::int64_t kDefaultTtlSeconds = 24 * 60 * 60;

struct CachedOutput {
  std::string output;
  std::int64_t stored_at = 0;  // epoch seconds
};

// IPreprocessCache memoizes preprocess() output keyed by make_cache_key().
// Entries older than the cache's TTL are misses; implementations delete them on sight.
class IPreprocessCache {
 public:
  virtual ~IPreprocessCache() = default;

  [[nodiscard]] virtual std::optional<CachedOutput> get(const std::string& key) = 0;
  virtual void put(const std::string& key, const CachedOutput& entry) = 0;

  // Removes every expired entry and returns how many were removed.
  virtual std::size_t purge_expired() = 0;

 protected:
  IPreprocessCache() = default;
  IPreprocessCache(const IPreprocessCache&) = default;
  IPreprocessCache& operator=(const IPreprocessCache&) = default;
  IPreprocessCache(IPreprocessCache&&) = default;
  IPreprocessCache& operator=(IPreprocessCache&&) = default;
};

// Everything besides the diff itself that determines preprocess() output.
struct CacheKeyFields {
  std::string counter_id;
  std::string model;
  int token_limit = 0;
  int include_all_threshold = 0;
  double cheap_path_ratio = 0.0;
  bool summarize_excluded = false;
};

// Stable key over the fields and the diff text.
[[nodiscard]] std::string make_cache_key(const CacheKeyFields& fields,
                                         std::string_view diff_text);

// True when an entry stored at `stored_at` is past `ttl_seconds` at time `now`.
[[nodiscard]] inline bool is_expired(const std::int64_t stored_at, const std::int64_t now,
                                     const std::int64_t ttl_seconds) {
  return now - stored_at > ttl_seconds;
}

}  // namespace diffbudget::cache
