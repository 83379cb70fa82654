#pragma once

#include "diffbudget/cache/preprocess_cache.h"
#include "diffbudget/core/clock.h"

#include <map>

namespace diffbudget::cache {

// InMemoryPreprocessCache keeps entries in a std::map for the lifetime of the process.
// Not thread-safe; owned and used by a single caller.
class InMemoryPreprocessCache final : public IPreprocessCache {
 public:
  InMemoryPreprocessCache(core::IClock& clock, std::int64_t ttl_seconds = kDefaultTtlSeconds);

  [[nodiscard]] std::optional<CachedOutput> get(const std::string& key) override;
  void put(const std::string& key, const CachedOutput& entry) override;
  std::size_t purge_expired() override;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }

 private:
  core::IClock& clock_;
  std::int64_t ttl_seconds_;
  std::map<std::string, CachedOutput> entries_;
};

}  // namespace diffbudget::cache
