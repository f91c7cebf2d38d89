#pragma once

#include "posmr/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to keep the SQLite header out of the public API
struct sqlite3;
struct sqlite3_stmt;

namespace posmr::storage::sqlite {

// SqliteDb owns one SQLite connection used to persist run audit trails.
// - RAII: connection released by a custom deleter
// - Errors reported through Result<T, std::string>
// - One connection per instance; callers serialize access
class SqliteDb {
 public:
  // Open or create the database at path (":memory:" for an in-memory database).
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied schema version, 0 on a fresh database.
  [[nodiscard]] int get_schema_version() const;

  // Apply schema v1 (audit_events) if not already applied. Idempotent.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection, for statement preparation by the stores in this namespace.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// RAII wrapper for a prepared statement.
class PreparedStatement {
 public:
  PreparedStatement(sqlite3* db, const std::string& sql);
  ~PreparedStatement() = default;

  PreparedStatement(const PreparedStatement&) = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;
  PreparedStatement(PreparedStatement&&) = delete;
  PreparedStatement& operator=(PreparedStatement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }
  [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace posmr::storage::sqlite
