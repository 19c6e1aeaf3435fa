// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::MariaStatement -- prepared version-row INSERT over MYSQL_STMT.
//
// Bind() takes the same 1-based index as Sqlite3Statement. Bound values
// are copied into storage owned by the statement, so the caller's
// variables may go out of scope before ExecDml(). The applied flag goes
// out as MYSQL_TYPE_TINY, which is what BOOLEAN is on MySQL and TiDB.

#pragma once

#include <cstdint>
#include <cstring>
#include <memory>

#include <mysql.h>

#include "dbver/error.hpp"

namespace dbver {

class MariaDb;

// ---------------------------------------------------------------------------
// MariaStatement
// ---------------------------------------------------------------------------

class MariaStatement {
 public:
  MariaStatement() = default;
  ~MariaStatement() { Finalize(); }

  MariaStatement(MariaStatement&& other) noexcept
      : stmt_(other.stmt_),
        params_(other.params_),
        binds_(std::move(other.binds_)),
        values_(std::move(other.values_)) {
    other.stmt_ = nullptr;
    other.params_ = 0;
  }

  MariaStatement& operator=(MariaStatement&& other) noexcept {
    if (this != &other) {
      Finalize();
      stmt_ = other.stmt_;
      params_ = other.params_;
      binds_ = std::move(other.binds_);
      values_ = std::move(other.values_);
      other.stmt_ = nullptr;
      other.params_ = 0;
    }
    return *this;
  }

  MariaStatement(const MariaStatement&) = delete;
  MariaStatement& operator=(const MariaStatement&) = delete;

  /// Returns the affected row count, -1 on failure.
  int32_t ExecDml(Error* out_error = nullptr) {
    if (stmt_ == nullptr) {
      ReportError(out_error, ErrorCode::kMisuse, kUnprepared);
      return -1;
    }
    if ((params_ > 0 && mysql_stmt_bind_param(stmt_, binds_.get()) != 0) ||
        mysql_stmt_execute(stmt_) != 0) {
      ReportError(out_error, ErrorCode::kError, mysql_stmt_error(stmt_));
      return -1;
    }
    return static_cast<int32_t>(mysql_stmt_affected_rows(stmt_));
  }

  int32_t ParamCount() const { return params_; }

  Error Bind(int32_t param, int64_t value) {
    MYSQL_BIND* bind = Slot(param);
    if (bind == nullptr) { return OutOfRange(); }
    Value& v = values_[param - 1];
    v.i64 = value;
    bind->buffer_type = MYSQL_TYPE_LONGLONG;
    bind->buffer = &v.i64;
    return Error::Ok();
  }

  Error Bind(int32_t param, bool value) {
    MYSQL_BIND* bind = Slot(param);
    if (bind == nullptr) { return OutOfRange(); }
    Value& v = values_[param - 1];
    v.tiny = value ? 1 : 0;
    bind->buffer_type = MYSQL_TYPE_TINY;
    bind->buffer = &v.tiny;
    return Error::Ok();
  }

  /// Drop bindings and any pending server-side state.
  Error Reset() {
    if (stmt_ == nullptr) { return Error::Make(ErrorCode::kMisuse, kUnprepared); }
    if (mysql_stmt_reset(stmt_) != 0) {
      return Error::Make(ErrorCode::kError, mysql_stmt_error(stmt_));
    }
    ClearBinds();
    return Error::Ok();
  }

  void Finalize() {
    if (stmt_ != nullptr) { mysql_stmt_close(stmt_); }
    stmt_ = nullptr;
    params_ = 0;
    binds_.reset();
    values_.reset();
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class MariaDb;

  static constexpr const char* kUnprepared = "statement is not prepared";

  union Value {
    int64_t i64;
    signed char tiny;
  };

  explicit MariaStatement(MYSQL_STMT* stmt)
      : stmt_(stmt),
        params_(static_cast<int32_t>(mysql_stmt_param_count(stmt))) {
    if (params_ > 0) {
      binds_.reset(new MYSQL_BIND[params_]);
      values_.reset(new Value[params_]());
      ClearBinds();
    }
  }

  MYSQL_BIND* Slot(int32_t param) {
    if (stmt_ == nullptr || param < 1 || param > params_) { return nullptr; }
    MYSQL_BIND* bind = &binds_[param - 1];
    std::memset(bind, 0, sizeof(MYSQL_BIND));
    return bind;
  }

  void ClearBinds() {
    if (params_ > 0) {
      std::memset(binds_.get(), 0, sizeof(MYSQL_BIND) * params_);
    }
  }

  Error OutOfRange() const {
    if (stmt_ == nullptr) { return Error::Make(ErrorCode::kMisuse, kUnprepared); }
    Error err;
    err.SetFormat(ErrorCode::kRange, "parameter index out of range (1..%d)",
                  params_);
    return err;
  }

  MYSQL_STMT* stmt_ = nullptr;
  int32_t params_ = 0;
  std::unique_ptr<MYSQL_BIND[]> binds_;
  std::unique_ptr<Value[]> values_;
};

}  // namespace dbver
