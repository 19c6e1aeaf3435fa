// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::MariaDb -- MySQL protocol connection (MariaDB, MySQL, TiDB).
//
// Design:
//   - Owns one MYSQL* handle; move-only, closed on destruction
//   - Same surface as Sqlite3Db, so Database<Backend>, Transaction and
//     VersionStore take either
//   - Failures land in an optional Error* out parameter carrying
//     mysql_error() text unmodified
//   - Session charset is utf8mb4
//
// Open() takes a MariaDsn string, see maria_dsn.hpp.

#pragma once

#include <cstdint>
#include <cstring>

#include <mysql.h>
#include <spdlog/spdlog.h>

#include "dbver/error.hpp"
#include "dbver/maria_dsn.hpp"
#include "dbver/maria_query.hpp"
#include "dbver/maria_statement.hpp"
#include "dbver/sql_text.hpp"
#include "dbver/table_name.hpp"

namespace dbver {

// ---------------------------------------------------------------------------
// MariaDb
// ---------------------------------------------------------------------------

class MariaDb {
 public:
  using QueryType     = MariaQuery;
  using StatementType = MariaStatement;

  MariaDb() = default;
  ~MariaDb() { Close(); }

  MariaDb(MariaDb&& other) noexcept
      : handle_(other.handle_), in_tx_(other.in_tx_) {
    other.handle_ = nullptr;
    other.in_tx_ = false;
  }

  MariaDb& operator=(MariaDb&& other) noexcept {
    if (this != &other) {
      Close();
      handle_ = other.handle_;
      in_tx_ = other.in_tx_;
      other.handle_ = nullptr;
      other.in_tx_ = false;
    }
    return *this;
  }

  MariaDb(const MariaDb&) = delete;
  MariaDb& operator=(const MariaDb&) = delete;

  Error Open(const char* dsn) {
    MariaDsn target;
    Error err = MariaDsn::Parse(dsn, &target);
    if (!err.ok()) { return err; }
    return Open(target);
  }

  Error Open(const MariaDsn& target) {
    Close();
    handle_ = mysql_init(nullptr);
    if (handle_ == nullptr) {
      return Error::Make(ErrorCode::kError, "out of memory");
    }
    if (mysql_real_connect(handle_, target.host, target.user,
                           target.PasswordOrNull(), target.DatabaseOrNull(),
                           target.port, nullptr, 0) == nullptr ||
        mysql_set_character_set(handle_, "utf8mb4") != 0) {
      Error err = Error::Make(ErrorCode::kError, mysql_error(handle_));
      Close();
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (handle_ != nullptr) {
      mysql_close(handle_);
      handle_ = nullptr;
    }
    in_tx_ = false;
  }

  bool IsOpen() const { return handle_ != nullptr; }

  /// Returns the affected row count, -1 on failure.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!Send(sql, out_error)) { return -1; }
    return static_cast<int32_t>(mysql_affected_rows(handle_));
  }

  /// Rows stream from the server (mysql_use_result); the connection
  /// accepts nothing else until the cursor is finalized.
  MariaQuery ExecQuery(const char* sql, Error* out_error = nullptr) {
    if (!Send(sql, out_error)) { return MariaQuery{}; }

    MYSQL_RES* res = mysql_use_result(handle_);
    if (res != nullptr) { return MariaQuery(handle_, res, out_error); }

    if (mysql_field_count(handle_) > 0) {
      ReportError(out_error, ErrorCode::kError, mysql_error(handle_));
    } else {
      ReportError(out_error, ErrorCode::kMisuse, "statement returned no rows");
    }
    return MariaQuery{};
  }

  MariaStatement CompileStatement(const char* sql,
                                  Error* out_error = nullptr) {
    if (!Usable(sql, out_error)) { return MariaStatement{}; }

    MYSQL_STMT* stmt = mysql_stmt_init(handle_);
    if (stmt == nullptr) {
      ReportError(out_error, ErrorCode::kError, mysql_error(handle_));
      return MariaStatement{};
    }
    unsigned long len = static_cast<unsigned long>(std::strlen(sql));
    if (mysql_stmt_prepare(stmt, sql, len) != 0) {
      ReportError(out_error, ErrorCode::kError, mysql_stmt_error(stmt));
      mysql_stmt_close(stmt);
      return MariaStatement{};
    }
    return MariaStatement(stmt);
  }

  /// Looks in the connection's current schema only.
  bool TableExists(const char* table) {
    if (!VersionTableName::IsValid(table)) { return false; }
    SqlText sql = SqlText::Format(
        "SELECT 1 FROM information_schema.tables "
        "WHERE table_schema = DATABASE() AND table_name = '%s' "
        "AND table_type = 'BASE TABLE'", table);
    MariaQuery q = ExecQuery(sql.c_str());
    return !q.Eof();
  }

  Error BeginTransaction() {
    Error err = Run("START TRANSACTION");
    in_tx_ = err.ok();
    return err;
  }

  Error Commit() {
    Error err = Run("COMMIT");
    if (err.ok()) { in_tx_ = false; }
    return err;
  }

  Error Rollback() {
    in_tx_ = false;
    return Run("ROLLBACK");
  }

  /// Tracks START TRANSACTION issued through this object. DDL on MySQL
  /// commits implicitly, which this flag does not see.
  bool InTransaction() const { return in_tx_; }

  /// Closest analogue of a busy handler: innodb_lock_wait_timeout,
  /// rounded up to whole seconds. The server's minimum is 1 second, so
  /// zero and negative values wait 1 second.
  void SetBusyTimeout(int32_t ms) {
    if (handle_ == nullptr) { return; }
    int64_t seconds = (static_cast<int64_t>(ms) + 999) / 1000;
    if (seconds < 1) { seconds = 1; }
    SqlText sql = SqlText::Format(
        "SET SESSION innodb_lock_wait_timeout = %lld",
        static_cast<long long>(seconds));
    Error err;
    if (ExecDml(sql.c_str(), &err) < 0) {
      SPDLOG_WARN("lock wait timeout not set: {}", err.message);
    }
  }

  MYSQL* Handle() const { return handle_; }

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

  bool Send(const char* sql, Error* out_error) {
    if (!Usable(sql, out_error)) { return false; }
    if (mysql_query(handle_, sql) == 0) { return true; }
    ReportError(out_error, ErrorCode::kError, mysql_error(handle_));
    return false;
  }

  Error Run(const char* sql) {
    Error err;
    ExecDml(sql, &err);
    return err;
  }

  MYSQL* handle_ = nullptr;
  bool in_tx_ = false;
};

}  // namespace dbver
