#include "diffbudget/cache/preprocess_cache.h"

#include "diffbudget/core/fingerprint.h"

#include <bit>

namespace diffbudget::cache {

std::string make_cache_key(const CacheKeyFields& fields, const std::string_view diff_text) {
  core::Fingerprint fingerprint;
  fingerprint.add(fields.counter_id)
      .add(fields.model)
      .add(static_cast<std::int64_t>(fields.token_limit))
      .add(static_cast<std::int64_t>(fields.include_all_threshold))
      .add(std::bit_cast<std::int64_t>(fields.cheap_path_ratio))
      .add(static_cast<std::int64_t>(fields.summarize_excluded ? 1 : 0))
      .add(diff_text);
  return fingerprint.hex();
}

}  // namespace diffbudget::cache
