#include "diffbudget/storage/sqlite/sqlite_preprocess_cache.h"

#include <sqlite3.h>

#include <utility>

namespace diffbudget::storage::sqlite {

SqlitePreprocessCache::SqlitePreprocessCache(std::shared_ptr<SqliteDb> db, core::IClock& clock,
                                             const std::int64_t ttl_seconds)
    : db_(std::move(db)), clock_(clock), ttl_seconds_(ttl_seconds) {}

std::optional<cache::CachedOutput> SqlitePreprocessCache::get(const std::string& key) {
  const char* sql = "SELECT output, stored_at FROM preprocess_cache WHERE cache_key = ?";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return std::nullopt;
  }

  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return std::nullopt;
  }

  cache::CachedOutput entry;
  const auto* output_text = sqlite3_column_text(stmt.get(), 0);
  const int output_bytes = sqlite3_column_bytes(stmt.get(), 0);
  if (output_text != nullptr) {
    entry.output.assign(reinterpret_cast<const char*>(output_text),
                        static_cast<std::size_t>(output_bytes));
  }
  entry.stored_at = sqlite3_column_int64(stmt.get(), 1);

  if (cache::is_expired(entry.stored_at, clock_.now_epoch_seconds(), ttl_seconds_)) {
    erase(key);
    return std::nullopt;
  }
  return entry;
}

void SqlitePreprocessCache::put(const std::string& key, const cache::CachedOutput& entry) {
  const char* sql = R"(
    INSERT INTO preprocess_cache (cache_key, output, stored_at)
    VALUES (?, ?, ?)
    ON CONFLICT(cache_key) DO UPDATE SET
      output = excluded.output,
      stored_at = excluded.stored_at
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return;
  }

  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, entry.output.data(), static_cast<int>(entry.output.size()),
                    SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt.get(), 3, entry.stored_at);

  sqlite3_step(stmt.get());
}

std::size_t SqlitePreprocessCache::purge_expired() {
  PreparedStatement stmt(db_->connection(), "DELETE FROM preprocess_cache WHERE stored_at < ?");
  if (!stmt.is_valid()) {
    return 0;
  }

  sqlite3_bind_int64(stmt.get(), 1, clock_.now_epoch_seconds() - ttl_seconds_);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return 0;
  }
  return static_cast<std::size_t>(sqlite3_changes(db_->connection()));
}

void SqlitePreprocessCache::erase(const std::string& key) {
  PreparedStatement stmt(db_->connection(), "DELETE FROM preprocess_cache WHERE cache_key = ?");
  if (!stmt.is_valid()) {
    return;
  }
  sqlite3_bind_text(stmt.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_step(stmt.get());
}

}  // namespace diffbudget::storage::sqlite
