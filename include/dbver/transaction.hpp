// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Transaction<DbT> -- RAII transaction over a connection.
//
// Design:
//   - Begin() opens the transaction; destructor rolls back unless
//     Commit() or Rollback() already finished it
//   - A failed Commit() leaves the transaction open: retry Commit(), or
//     Rollback(), or let the destructor roll it back
//   - ExecDml() forwards to the connection; the auxiliary setup of a
//     dialect receives a Transaction and only adds statements to it
//   - DbT is any connection with ExecDml/BeginTransaction/Commit/Rollback
//     (Sqlite3Db, MariaDb, Database<Backend>, ...)

#pragma once

#include <cstdint>

#include <spdlog/spdlog.h>

#include "dbver/error.hpp"

namespace dbver {

template <typename DbT>
class Transaction {
 public:
  explicit Transaction(DbT& db) : db_(&db) {}

  ~Transaction() {
    if (active_) {
      Error err = db_->Rollback();
      if (!err.ok()) {
        SPDLOG_ERROR("implicit rollback failed: {}", err.message);
      }
    }
  }

  // No copy, no move: the transaction is pinned to its scope.
  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  Error Begin() {
    if (active_) {
      return Error::Make(ErrorCode::kMisuse, "transaction already open");
    }
    Error err = db_->BeginTransaction();
    if (err.ok()) { active_ = true; }
    return err;
  }

  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!active_) {
      ReportError(out_error, ErrorCode::kMisuse, "transaction not open");
      return -1;
    }
    return db_->ExecDml(sql, out_error);
  }

  Error Commit() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "transaction not open");
    }
    Error err = db_->Commit();
    if (err.ok()) { active_ = false; }
    return err;
  }

  Error Rollback() {
    if (!active_) {
      return Error::Make(ErrorCode::kMisuse, "transaction not open");
    }
    active_ = false;
    return db_->Rollback();
  }

  bool Active() const { return active_; }

  DbT& Connection() { return *db_; }

 private:
  DbT* db_;
  bool active_ = false;
};

}  // namespace dbver
