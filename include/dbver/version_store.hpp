// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::VersionStore<DbT> -- bookkeeping on the version-history table.
//
// Design:
//   - Borrows a connection and holds an immutable Dialect; owns neither
//     the database nor any global state
//   - The table is an append-only event log: applying or rolling back a
//     migration inserts a row, nothing is updated or deleted
//   - EnsureVersionTable() creates the table, runs the dialect's auxiliary
//     setup and seeds version 0, all in one transaction
//
// Usage:
//   dbver::Db db;
//   db.Open("app.db");
//   dbver::VersionStore<dbver::Db> store(
//       db, dbver::Dialect(dbver::DialectKind::kSqlite3));
//   store.EnsureVersionTable();
//   store.RecordApplied(20240101);
//   int64_t current = 0;
//   store.CurrentVersion(&current);

#pragma once

#include <cstdint>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "dbver/dialect.hpp"
#include "dbver/error.hpp"
#include "dbver/sql_text.hpp"
#include "dbver/transaction.hpp"
#include "dbver/version_cursor.hpp"
#include "dbver/version_ops.hpp"

namespace dbver {

template <typename DbT>
class VersionStore {
 public:
  /// Version recorded when the table is first created.
  static constexpr int64_t kBaseVersion = 0;

  VersionStore(DbT& db, const Dialect& dialect)
      : db_(&db), dialect_(dialect) {}

  const Dialect& GetDialect() const { return dialect_; }

  /// Create and seed the version table unless it already exists.
  Error EnsureVersionTable() {
    if (db_->TableExists(dialect_.TableName())) { return Error::Ok(); }

    Transaction<DbT> tx(*db_);
    Error err = tx.Begin();
    if (!err.ok()) { return err; }

    SqlText create = dialect_.CreateVersionTableSql();
    tx.ExecDml(create.c_str(), &err);
    if (!err.ok()) { return err; }

    err = DbRunAux(dialect_, tx);
    if (!err.ok()) { return err; }

    err = Insert(kBaseVersion, true);
    if (!err.ok()) { return err; }

    err = tx.Commit();
    if (!err.ok()) { return err; }

    SPDLOG_INFO("created version table {} ({})", dialect_.TableName(),
                dialect_.Name());
    return Error::Ok();
  }

  Error RecordApplied(int64_t version) { return Record(version, true); }

  Error RecordRolledBack(int64_t version) { return Record(version, false); }

  /// Newest applied version whose latest event is not a rollback.
  /// Writes kBaseVersion when the log holds nothing applied.
  Error CurrentVersion(int64_t* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }

    Error err;
    auto cursor = DbVersionQuery(dialect_, *db_, &err);
    if (!err.ok()) { return err; }

    // Rows arrive newest first, so the first row seen for a version is its
    // current state. Versions whose current state is "rolled back" are
    // remembered and their older rows ignored.
    std::unordered_set<int64_t> rolled_back;

    for (; !cursor.Eof(); cursor.Next(&err)) {
      VersionRow row = cursor.Row();
      if (rolled_back.count(row.version_id) != 0) { continue; }
      if (row.is_applied) {
        *out = row.version_id;
        return Error::Ok();
      }
      rolled_back.insert(row.version_id);
    }
    if (!err.ok()) { return err; }

    *out = kBaseVersion;
    return Error::Ok();
  }

  /// State of one version: its newest row decides, absent means false.
  Error IsApplied(int64_t version, bool* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }

    Error err;
    auto cursor = DbVersionQuery(dialect_, *db_, &err);
    if (!err.ok()) { return err; }

    for (; !cursor.Eof(); cursor.Next(&err)) {
      VersionRow row = cursor.Row();
      if (row.version_id == version) {
        *out = row.is_applied;
        return Error::Ok();
      }
    }
    if (!err.ok()) { return err; }

    *out = false;
    return Error::Ok();
  }

 private:
  Error Record(int64_t version, bool applied) {
    Error err = Insert(version, applied);
    if (err.ok()) {
      SPDLOG_DEBUG("{} version {} {}", dialect_.TableName(), version,
                   applied ? "applied" : "rolled back");
    }
    return err;
  }

  Error Insert(int64_t version, bool applied) {
    Error err;
    SqlText sql = dialect_.InsertVersionSql();
    auto stmt = db_->CompileStatement(sql.c_str(), &err);
    if (!err.ok()) { return err; }

    err = stmt.Bind(1, version);
    if (!err.ok()) { return err; }
    err = stmt.Bind(2, applied);
    if (!err.ok()) { return err; }

    stmt.ExecDml(&err);
    return err;
  }

  DbT* db_;
  Dialect dialect_;
};

}  // namespace dbver
