#pragma once

#include "diffbudget/cache/preprocess_cache.h"
#include "diffbudget/core/clock.h"
#include "diffbudget/storage/sqlite/sqlite_db.h"

#include <memory>

namespace diffbudget::storage::sqlite {

// SqlitePreprocessCache implements IPreprocessCache on the preprocess_cache table.
// Requires schema v1 (ensure_schema_v2 recommended for the stored_at index).
// Write failures are silent: a cache that cannot store simply misses next time.
class SqlitePreprocessCache final : public cache::IPreprocessCache {
 public:
  SqlitePreprocessCache(std::shared_ptr<SqliteDb> db, core::IClock& clock,
                        std::int64_t ttl_seconds = cache::kDefaultTtlSeconds);

  [[nodiscard]] std::optional<cache::CachedOutput> get(const std::string& key) override;
  void put(const std::string& key, const cache::CachedOutput& entry) override;
  std::size_t purge_expired() override;

 private:
  void erase(const std::string& key);

  std::shared_ptr<SqliteDb> db_;
  core::IClock& clock_;
  std::int64_t ttl_seconds_;
};

}  // namespace diffbudget::storage::sqlite
