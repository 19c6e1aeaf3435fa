// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Sqlite3Db -- SQLite3 connection holding a version table.
//
// Design:
//   - Owns one sqlite3* handle; move-only, closed on destruction
//   - Failures land in an optional Error* out parameter, messages are
//     sqlite3_errmsg() text unmodified
//   - BeginTransaction() takes the write lock up front (BEGIN IMMEDIATE),
//     so two processes bootstrapping the same file serialize on the busy
//     handler instead of failing at the first write

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "dbver/error.hpp"
#include "dbver/sqlite3_query.hpp"
#include "dbver/sqlite3_statement.hpp"
#include "dbver/table_name.hpp"

namespace dbver {

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  using QueryType     = Sqlite3Query;
  using StatementType = Sqlite3Statement;

  Sqlite3Db() = default;
  ~Sqlite3Db() { Close(); }

  Sqlite3Db(Sqlite3Db&& other) noexcept : handle_(other.handle_) {
    other.handle_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      handle_ = other.handle_;
      other.handle_ = nullptr;
    }
    return *this;
  }

  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  /// Open (or create) the database file. ":memory:" gives a private
  /// in-memory database. A previously open handle is closed first.
  Error Open(const char* path) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    const int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path, &handle_, kFlags, nullptr) == SQLITE_OK) {
      return Error::Ok();
    }
    Error err = Error::Make(ErrorCode::kError,
        handle_ != nullptr ? sqlite3_errmsg(handle_) : "out of memory");
    Close();
    return err;
  }

  void Close() {
    if (handle_ == nullptr) { return; }
    sqlite3_close(handle_);
    handle_ = nullptr;
  }

  bool IsOpen() const { return handle_ != nullptr; }

  /// Run one or more statements without result rows.
  /// Returns the change count of the last statement, -1 on failure.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!Usable(sql, out_error)) { return -1; }

    char* msg = nullptr;
    if (sqlite3_exec(handle_, sql, nullptr, nullptr, &msg) == SQLITE_OK) {
      return sqlite3_changes(handle_);
    }
    ReportError(out_error, ErrorCode::kError,
                msg != nullptr ? msg : sqlite3_errmsg(handle_));
    sqlite3_free(msg);
    return -1;
  }

  /// Prepare and step to the first row. A failed query comes back already
  /// at Eof() with the reason in *out_error.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    sqlite3_stmt* stmt = Prepare(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Query{}; }

    switch (sqlite3_step(stmt)) {
      case SQLITE_ROW:  return Sqlite3Query(handle_, stmt, false);
      case SQLITE_DONE: return Sqlite3Query(handle_, stmt, true);
      default: break;
    }
    ReportError(out_error, ErrorCode::kError, sqlite3_errmsg(handle_));
    sqlite3_finalize(stmt);
    return Sqlite3Query{};
  }

  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    sqlite3_stmt* stmt = Prepare(sql, out_error);
    if (stmt == nullptr) { return Sqlite3Statement{}; }
    return Sqlite3Statement(handle_, stmt);
  }

  /// True when a table (not a view) of that name exists. Names that are
  /// not valid version table identifiers are never looked up.
  bool TableExists(const char* table) {
    if (!VersionTableName::IsValid(table)) { return false; }
    sqlite3_stmt* stmt = Prepare(
        "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1;",
        nullptr);
    if (stmt == nullptr) { return false; }

    bool found = false;
    if (sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC) == SQLITE_OK) {
      found = (sqlite3_step(stmt) == SQLITE_ROW);
    }
    sqlite3_finalize(stmt);
    return found;
  }

  Error BeginTransaction() { return Run("BEGIN IMMEDIATE;"); }
  Error Commit() { return Run("COMMIT;"); }
  Error Rollback() { return Run("ROLLBACK;"); }

  bool InTransaction() const {
    return handle_ != nullptr && sqlite3_get_autocommit(handle_) == 0;
  }

  void SetBusyTimeout(int32_t ms) {
    if (handle_ != nullptr) { sqlite3_busy_timeout(handle_, ms); }
  }

  sqlite3* Handle() const { return handle_; }

 private:
  bool Usable(const char* sql, Error* out_error) const {
    if (handle_ == nullptr) {
      ReportError(out_error, ErrorCode::kNotOpen, "database is not open");
      return false;
    }
    if (sql == nullptr) {
      ReportError(out_error, ErrorCode::kNullParam, "sql is null");
      return false;
    }
    return true;
  }

  sqlite3_stmt* Prepare(const char* sql, Error* out_error) {
    if (!Usable(sql, out_error)) { return nullptr; }
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(handle_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      ReportError(out_error, ErrorCode::kError, sqlite3_errmsg(handle_));
      sqlite3_finalize(stmt);
      return nullptr;
    }
    return stmt;
  }

  Error Run(const char* sql) {
    Error err;
    ExecDml(sql, &err);
    return err;
  }

  sqlite3* handle_ = nullptr;
};

}  // namespace dbver
