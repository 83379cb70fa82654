#pragma once

#include "diffbudget/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace diffbudget::storage::sqlite {

// SqliteDb owns one SQLite connection and the schema migrations applied to it.
// - RAII: connection managed via unique_ptr with custom deleter
// - Errors reported via Result<T,E>; nothing here throws
// - One connection per instance; callers do not share it across threads
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates a private in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied schema version (0 if none)
  [[nodiscard]] int get_schema_version() const;

  // v1: schema_version + preprocess_cache tables
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  // v2: index on preprocess_cache.stored_at for expiry sweeps (applies v1 first)
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v2();

  // Execute SQL statement (for non-query operations)
  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection, for prepared statements in store implementations
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  [[nodiscard]] core::Result<bool, std::string> apply_schema(int version, const char* sql);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for prepared statements
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] std::string error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace diffbudget::storage::sqlite
