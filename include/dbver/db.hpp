// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Database<Backend> -- one connection type per server family.
//
// A Backend bundles the connection, query and statement types together
// with the dialect its server speaks natively:
//
//   Backend          connection    native dialect
//   Sqlite3Backend   Sqlite3Db     sqlite3
//   MariaBackend     MariaDb       mysql (tidb speaks the same protocol)
//
// Database forwards everything to Backend::Db, so VersionStore and the
// version_ops templates accept either the facade or the raw connection.
//
//   dbver::Db db;                          // SQLite3
//   db.Open("app.db");
//   dbver::Dialect d = dbver::Db::NativeDialect();
//
//   dbver::MDb mdb;                        // needs DBVER_HAS_MARIADB=1
//   mdb.Open("localhost:3306:root:pass:appdb");

#pragma once

#include <cstdint>
#include <utility>

#include "dbver/dialect.hpp"
#include "dbver/error.hpp"
#include "dbver/sqlite3_backend.hpp"
#include "dbver/table_name.hpp"

#if defined(DBVER_HAS_MARIADB) && DBVER_HAS_MARIADB
#include "dbver/maria_backend.hpp"
#endif

namespace dbver {

// ---------------------------------------------------------------------------
// Database<Backend>
// ---------------------------------------------------------------------------

template <typename Backend = Sqlite3Backend>
class Database {
 public:
  using DbType        = typename Backend::Db;
  using QueryType     = typename Backend::Query;
  using StatementType = typename Backend::Statement;

  static constexpr DialectKind kDialect = Backend::kDialect;

  /// Dialect for this backend's server, optionally on a custom table.
  static Dialect NativeDialect(const VersionTableName& table = {}) {
    return Dialect(kDialect, table);
  }

  Database() = default;

  Database(Database&& other) noexcept : conn_(std::move(other.conn_)) {}

  Database& operator=(Database&& other) noexcept {
    if (this != &other) { conn_ = std::move(other.conn_); }
    return *this;
  }

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  Error Open(const char* target) { return conn_.Open(target); }
  void Close() { conn_.Close(); }
  bool IsOpen() const { return conn_.IsOpen(); }

  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    return conn_.ExecDml(sql, out_error);
  }

  QueryType ExecQuery(const char* sql, Error* out_error = nullptr) {
    return conn_.ExecQuery(sql, out_error);
  }

  StatementType CompileStatement(const char* sql, Error* out_error = nullptr) {
    return conn_.CompileStatement(sql, out_error);
  }

  bool TableExists(const char* table) { return conn_.TableExists(table); }

  Error BeginTransaction() { return conn_.BeginTransaction(); }
  Error Commit() { return conn_.Commit(); }
  Error Rollback() { return conn_.Rollback(); }
  bool InTransaction() const { return conn_.InTransaction(); }

  void SetBusyTimeout(int32_t ms) { conn_.SetBusyTimeout(ms); }

  DbType& Impl() { return conn_; }
  const DbType& Impl() const { return conn_; }

 private:
  DbType conn_;
};

// ---------------------------------------------------------------------------
// Aliases
// ---------------------------------------------------------------------------

using Db        = Database<Sqlite3Backend>;
using Query     = Db::QueryType;
using Statement = Db::StatementType;

#if defined(DBVER_HAS_MARIADB) && DBVER_HAS_MARIADB
using MDb        = Database<MariaBackend>;
using MQuery     = MDb::QueryType;
using MStatement = MDb::StatementType;
#endif

}  // namespace dbver
