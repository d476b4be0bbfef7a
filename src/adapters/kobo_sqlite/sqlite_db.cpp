// File: src/adapters/kobo_sqlite/sqlite_db.cpp
#include "readlog/adapters/kobo_sqlite/sqlite_db.hpp"

#include <filesystem>
#include <utility>

namespace readlog {
namespace {

std::string errmsg(sqlite3* db, const char* what) {
  return std::string(what) + ": " + (db ? sqlite3_errmsg(db) : "sqlite error");
}

}  // namespace

// -----------------------------
// SqliteStatement
// -----------------------------

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

SqliteStatement::SqliteStatement(SqliteStatement&& other) noexcept
    : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

SqliteStatement& SqliteStatement::operator=(SqliteStatement&& other) noexcept {
  if (this != &other) {
    if (stmt_) sqlite3_finalize(stmt_);
    db_ = other.db_;
    stmt_ = std::exchange(other.stmt_, nullptr);
  }
  return *this;
}

Status SqliteStatement::bind_text(int index, const std::string& value) {
  const int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) return Status::io_error(errmsg(db_, "sqlite bind"));
  return Status::ok_status();
}

Result<bool> SqliteStatement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return Result<bool>::ok(true);
  if (rc == SQLITE_DONE) return Result<bool>::ok(false);
  return Result<bool>::err(Status::io_error(errmsg(db_, "sqlite step")));
}

std::optional<std::string> SqliteStatement::column_text(int col) const {
  if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
  const auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
  const int n = sqlite3_column_bytes(stmt_, col);
  if (!p) return std::string();
  return std::string(p, static_cast<std::size_t>(n));
}

// -----------------------------
// SqliteDb
// -----------------------------

SqliteDb::~SqliteDb() {
  if (db_) sqlite3_close(db_);
}

Result<std::unique_ptr<SqliteDb>> SqliteDb::open_read_only(const std::string& path) {
  using R = Result<std::unique_ptr<SqliteDb>>;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return R::err(Status::missing_source("database not found: " + path));
  }

  sqlite3* db = nullptr;
  const int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = errmsg(db, ("cannot open " + path).c_str());
    if (db) sqlite3_close(db);
    return R::err(Status::missing_source(std::move(msg)));
  }
  sqlite3_busy_timeout(db, 5000);

  return R::ok(std::unique_ptr<SqliteDb>(new SqliteDb(db)));
}

Result<bool> SqliteDb::has_table(const std::string& table) {
  auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name = ?1 LIMIT 1;");
  if (!stmt.ok()) return Result<bool>::err(stmt.status());

  const Status b = stmt->bind_text(1, table);
  if (!b.ok()) return Result<bool>::err(b);
  return stmt->step();
}

Result<SqliteStatement> SqliteDb::prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    if (stmt) sqlite3_finalize(stmt);
    return Result<SqliteStatement>::err(Status::io_error(errmsg(db_, "sqlite prepare")));
  }
  return Result<SqliteStatement>::ok(SqliteStatement(db_, stmt));
}

}  // namespace readlog
