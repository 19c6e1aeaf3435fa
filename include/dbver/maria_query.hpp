// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::MariaQuery -- forward-only cursor over mysql_use_result().
//
// Rows stream from the server one at a time. Every column arrives as
// text: GetInt64() parses it, and a BOOLEAN (TINYINT(1)) reads as "0"/"1".
// mysql_fetch_row() returns NULL both at the end and on failure, so a
// NULL row is checked against mysql_errno() before being taken as the end.

#pragma once

#include <cstdint>
#include <cstdlib>

#include <mysql.h>

#include "dbver/error.hpp"

namespace dbver {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaQuery
// ---------------------------------------------------------------------------

class MariaQuery {
 public:
  MariaQuery() = default;
  ~MariaQuery() { Finalize(); }

  MariaQuery(MariaQuery&& other) noexcept { TakeFrom(other); }

  MariaQuery& operator=(MariaQuery&& other) noexcept {
    if (this != &other) {
      Finalize();
      TakeFrom(other);
    }
    return *this;
  }

  MariaQuery(const MariaQuery&) = delete;
  MariaQuery& operator=(const MariaQuery&) = delete;

  int32_t NumFields() const { return columns_; }

  bool FieldIsNull(int32_t col) const {
    return row_ == nullptr || col < 0 || col >= columns_ ||
           row_[col] == nullptr;
  }

  int64_t GetInt64(int32_t col, int64_t null_value = 0) const {
    return FieldIsNull(col) ? null_value
                            : static_cast<int64_t>(
                                  std::strtoll(row_[col], nullptr, 10));
  }

  const char* GetString(int32_t col, const char* null_value = "") const {
    return FieldIsNull(col) ? null_value : row_[col];
  }

  bool Eof() const { return row_ == nullptr; }

  void NextRow(Error* out_error = nullptr) {
    if (row_ != nullptr) { Fetch(out_error); }
  }

  /// Drains any unread rows, which frees the connection for new commands.
  void Finalize() {
    if (res_ != nullptr) { mysql_free_result(res_); }
    conn_ = nullptr;
    res_ = nullptr;
    row_ = nullptr;
    columns_ = 0;
  }

 private:
  friend class MariaDb;

  MariaQuery(MYSQL* conn, MYSQL_RES* res, Error* out_error)
      : conn_(conn), res_(res),
        columns_(static_cast<int32_t>(mysql_num_fields(res))) {
    Fetch(out_error);
  }

  void Fetch(Error* out_error) {
    row_ = mysql_fetch_row(res_);
    if (row_ == nullptr && mysql_errno(conn_) != 0) {
      ReportError(out_error, ErrorCode::kError, mysql_error(conn_));
    }
  }

  void TakeFrom(MariaQuery& other) {
    conn_ = other.conn_;
    res_ = other.res_;
    row_ = other.row_;
    columns_ = other.columns_;
    other.conn_ = nullptr;
    other.res_ = nullptr;
    other.row_ = nullptr;
    other.columns_ = 0;
  }

  MYSQL* conn_ = nullptr;
  MYSQL_RES* res_ = nullptr;
  MYSQL_ROW row_ = nullptr;
  int32_t columns_ = 0;
};

}  // namespace dbver
