#include "diffbudget/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace diffbudget::storage::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS preprocess_cache (
  cache_key TEXT PRIMARY KEY,
  output TEXT NOT NULL,
  stored_at INTEGER NOT NULL
);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, datetime('now'));
)";

constexpr const char* kSchemaV2 = R"(
CREATE INDEX IF NOT EXISTS idx_preprocess_cache_stored_at ON preprocess_cache(stored_at);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (2, datetime('now'));
)";

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

void PreparedStatement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  sqlite3* db = nullptr;
  const int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string error = db != nullptr ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    return core::Result<std::shared_ptr<SqliteDb>, std::string>::err("Failed to open database: " +
                                                                     error);
  }

  // Several CLI processes may share one cache file.
  sqlite3_busy_timeout(db, kBusyTimeoutMs);

  return core::Result<std::shared_ptr<SqliteDb>, std::string>::ok(
      std::shared_ptr<SqliteDb>(new SqliteDb(db)));
}

int SqliteDb::get_schema_version() const {
  PreparedStatement stmt(db_.get(),
                         "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
  if (!stmt.is_valid()) {
    return 0;  // Table doesn't exist yet
  }

  int version = 0;
  if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    version = sqlite3_column_int(stmt.get(), 0);
  }
  return version;
}

core::Result<bool, std::string> SqliteDb::apply_schema(const int version, const char* sql) {
  if (get_schema_version() >= version) {
    return core::Result<bool, std::string>::ok(true);
  }

  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("Failed to apply schema v" +
                                                std::to_string(version) + ": " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v1() {
  return apply_schema(1, kSchemaV1);
}

core::Result<bool, std::string> SqliteDb::ensure_schema_v2() {
  auto v1_result = ensure_schema_v1();
  if (!v1_result.has_value()) {
    return v1_result;
  }
  return apply_schema(2, kSchemaV2);
}

core::Result<bool, std::string> SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : "Unknown error";
    sqlite3_free(err_msg);
    return core::Result<bool, std::string>::err("SQL execution failed: " + error);
  }

  return core::Result<bool, std::string>::ok(true);
}

PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* raw_stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &raw_stmt, nullptr);
  if (rc != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw_stmt);
  } else {
    stmt_.reset(raw_stmt);
  }
}

}  // namespace diffbudget::storage::sqlite
