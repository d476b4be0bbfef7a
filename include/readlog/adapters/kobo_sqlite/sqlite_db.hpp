// File: include/readlog/adapters/kobo_sqlite/sqlite_db.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <sqlite3.h>

#include "readlog/core/status.hpp"

namespace readlog {

// Prepared statement. Finalized on destruction; move-only.
class SqliteStatement {
 public:
  SqliteStatement(sqlite3* db, sqlite3_stmt* stmt) : db_(db), stmt_(stmt) {}
  ~SqliteStatement();

  SqliteStatement(SqliteStatement&& other) noexcept;
  SqliteStatement& operator=(SqliteStatement&& other) noexcept;
  SqliteStatement(const SqliteStatement&) = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  // 1-based, as in sqlite3_bind_*.
  Status bind_text(int index, const std::string& value);

  // true while a row is available, false once the statement is done.
  Result<bool> step();

  // NULL columns come back as nullopt. Numeric columns are rendered as text by SQLite.
  std::optional<std::string> column_text(int col) const;

 private:
  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

// Read-only connection.
class SqliteDb {
 public:
  ~SqliteDb();

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;

  // missing_source when the file does not exist or SQLite refuses it.
  static Result<std::unique_ptr<SqliteDb>> open_read_only(const std::string& path);

  Result<bool> has_table(const std::string& table);
  Result<SqliteStatement> prepare(const std::string& sql);

 private:
  explicit SqliteDb(sqlite3* db) : db_(db) {}

  sqlite3* db_ = nullptr;
};

}  // namespace readlog
