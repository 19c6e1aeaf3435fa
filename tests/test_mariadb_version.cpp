// Copyright (c) 2024 liudegui. MIT License.
// Version table on a live MySQL/MariaDB server, with the mysql and tidb
// dialects (TiDB DDL is valid MySQL).
//
// Environment variables:
//   DBVER_MARIA_DSN  -- DSN string, default "localhost:3306:root::dbver_test"

#include <catch2/catch.hpp>
#include <cstdlib>

#include "dbver/db.hpp"
#include "dbver/version_ops.hpp"
#include "dbver/version_store.hpp"

using namespace dbver;

static const char* GetDsn() {
  const char* dsn = std::getenv("DBVER_MARIA_DSN");
  return (dsn != nullptr) ? dsn : "localhost:3306:root::dbver_test";
}

static MDb OpenCleanDb() {
  MDb db;
  REQUIRE(db.Open(GetDsn()).ok());
  db.ExecDml("DROP TABLE IF EXISTS db_version;");
  return db;
}

TEST_CASE("MariaDb version table: newest row first", "[mariadb]") {
  const DialectKind kinds[] = {DialectKind::kMySql, DialectKind::kTiDb};
  for (DialectKind kind : kinds) {
    auto db = OpenCleanDb();
    Dialect d(kind);
    INFO(d.Name());

    Error err;
    db.ExecDml(d.CreateVersionTableSql().c_str(), &err);
    REQUIRE(err.ok());

    auto stmt = db.CompileStatement(d.InsertVersionSql().c_str(), &err);
    REQUIRE(err.ok());
    const VersionRow rows[] = {{1, true}, {1, false}, {2, true}};
    for (const VersionRow& row : rows) {
      REQUIRE(stmt.Bind(1, row.version_id).ok());
      REQUIRE(stmt.Bind(2, row.is_applied).ok());
      REQUIRE(stmt.ExecDml(&err) == 1);
    }
    stmt.Finalize();

    auto cursor = DbVersionQuery(d, db, &err);
    REQUIRE(err.ok());
    REQUIRE(cursor.Row() == VersionRow{2, true});
    cursor.Next(&err);
    REQUIRE(cursor.Row() == VersionRow{1, false});
    cursor.Next(&err);
    REQUIRE(cursor.Row() == VersionRow{1, true});
    cursor.Next(&err);
    REQUIRE(cursor.Eof());
    REQUIRE(err.ok());
  }
}

TEST_CASE("MariaDb version table: VersionStore", "[mariadb]") {
  auto db = OpenCleanDb();
  VersionStore<MDb> store(db, Dialect(MDb::kDialect));

  REQUIRE(store.EnsureVersionTable().ok());
  REQUIRE(store.EnsureVersionTable().ok());
  REQUIRE(store.RecordApplied(1).ok());
  REQUIRE(store.RecordApplied(2).ok());
  REQUIRE(store.RecordRolledBack(2).ok());

  int64_t current = 0;
  REQUIRE(store.CurrentVersion(&current).ok());
  REQUIRE(current == 1);

  bool applied = true;
  REQUIRE(store.IsApplied(2, &applied).ok());
  REQUIRE_FALSE(applied);
}

TEST_CASE("MariaDb version table: query error is passed through",
          "[mariadb]") {
  auto db = OpenCleanDb();
  Error err;
  auto cursor = DbVersionQuery(Dialect(DialectKind::kMySql), db, &err);
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(cursor.Eof());
}
