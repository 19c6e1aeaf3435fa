// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Sqlite3Statement -- prepared version-row INSERT.
//
// Parameters are 1-based, as in sqlite3_bind_*. A version id binds as
// INTEGER, the applied flag as INTEGER 0/1. ExecDml() resets the statement
// afterwards, keeping the bindings, so it can run again with new values.

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "dbver/error.hpp"

namespace dbver {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;
  ~Sqlite3Statement() { Finalize(); }

  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : conn_(other.conn_), stmt_(other.stmt_) {
    other.conn_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      conn_ = other.conn_;
      stmt_ = other.stmt_;
      other.conn_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  /// Step once. Returns the change count, -1 on failure.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (stmt_ == nullptr) {
      ReportError(out_error, ErrorCode::kMisuse, kUnprepared);
      return -1;
    }
    int32_t changes = -1;
    if (sqlite3_step(stmt_) == SQLITE_DONE) {
      changes = sqlite3_changes(conn_);
    } else {
      ReportError(out_error, ErrorCode::kError, sqlite3_errmsg(conn_));
    }
    sqlite3_reset(stmt_);
    return changes;
  }

  int32_t ParamCount() const {
    return stmt_ != nullptr ? sqlite3_bind_parameter_count(stmt_) : 0;
  }

  Error Bind(int32_t param, int64_t value) {
    if (stmt_ == nullptr) { return Error::Make(ErrorCode::kMisuse, kUnprepared); }
    return BindResult(sqlite3_bind_int64(stmt_, param, value));
  }

  Error Bind(int32_t param, bool value) {
    if (stmt_ == nullptr) { return Error::Make(ErrorCode::kMisuse, kUnprepared); }
    return BindResult(sqlite3_bind_int(stmt_, param, value ? 1 : 0));
  }

  /// Rewind and drop all bindings.
  Error Reset() {
    if (stmt_ == nullptr) { return Error::Make(ErrorCode::kMisuse, kUnprepared); }
    sqlite3_reset(stmt_);
    if (sqlite3_clear_bindings(stmt_) != SQLITE_OK) {
      return Error::Make(ErrorCode::kError, sqlite3_errmsg(conn_));
    }
    return Error::Ok();
  }

  void Finalize() {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Db;

  static constexpr const char* kUnprepared = "statement is not prepared";

  Sqlite3Statement(sqlite3* conn, sqlite3_stmt* stmt)
      : conn_(conn), stmt_(stmt) {}

  Error BindResult(int rc) const {
    if (rc == SQLITE_OK) { return Error::Ok(); }
    return Error::Make(ErrorCode::kRange, sqlite3_errmsg(conn_));
  }

  sqlite3* conn_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace dbver
