#include "diffbudget/cache/inmemory_preprocess_cache.h"

namespace diffbudget::cache {

InMemoryPreprocessCache::InMemoryPreprocessCache(core::IClock& clock,
                                                 const std::int64_t ttl_seconds)
    : clock_(clock), ttl_seconds_(ttl_seconds) {}

std::optional<CachedOutput> InMemoryPreprocessCache::get(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (is_expired(it->second.stored_at, clock_.now_epoch_seconds(), ttl_seconds_)) {
    entries_.erase(it);
    return std::nullopt;
  }
  return it->second;
}

void InMemoryPreprocessCache::put(const std::string& key, const CachedOutput& entry) {
  entries_[key] = entry;
}

std::size_t InMemoryPreprocessCache::purge_expired() {
  const std::int64_t now = clock_.now_epoch_seconds();
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (is_expired(it->second.stored_at, now, ttl_seconds_)) {
      it = entries_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace diffbudget::cache
