// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Sqlite3Query -- forward-only cursor over a stepped sqlite3_stmt.
//
// The connection steps the first row before handing the cursor out, so
// Eof() is meaningful immediately. Each NextRow() steps once; a step that
// is neither ROW nor DONE ends iteration and reports sqlite3_errmsg().
// Columns are read by 0-based index.

#pragma once

#include <cstdint>

#include "sqlite3.h"

#include "dbver/error.hpp"

namespace dbver {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;
  ~Sqlite3Query() { Finalize(); }

  Sqlite3Query(Sqlite3Query&& other) noexcept { TakeFrom(other); }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      TakeFrom(other);
    }
    return *this;
  }

  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  int32_t NumFields() const { return columns_; }

  bool FieldIsNull(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= columns_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    return FieldIsNull(col) ? null_value : sqlite3_column_int64(stmt_, col);
  }

  /// Column text; SQLite renders INTEGER 0/1 as "0"/"1".
  const char* GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    return text != nullptr ? reinterpret_cast<const char*>(text) : null_value;
  }

  bool Eof() const { return done_; }

  void NextRow(Error* out_error = nullptr) {
    if (done_) { return; }
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    done_ = true;
    if (rc != SQLITE_DONE) {
      ReportError(out_error, ErrorCode::kError, sqlite3_errmsg(conn_));
    }
  }

  void Finalize() {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    conn_ = nullptr;
    done_ = true;
    columns_ = 0;
  }

 private:
  friend class Sqlite3Db;

  Sqlite3Query(sqlite3* conn, sqlite3_stmt* stmt, bool done)
      : conn_(conn), stmt_(stmt), done_(done),
        columns_(sqlite3_column_count(stmt)) {}

  void TakeFrom(Sqlite3Query& other) {
    conn_ = other.conn_;
    stmt_ = other.stmt_;
    done_ = other.done_;
    columns_ = other.columns_;
    other.conn_ = nullptr;
    other.stmt_ = nullptr;
    other.done_ = true;
    other.columns_ = 0;
  }

  sqlite3* conn_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool done_ = true;
  int32_t columns_ = 0;
};

}  // namespace dbver
