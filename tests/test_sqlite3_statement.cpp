// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbver::Sqlite3Statement.

#include <catch2/catch.hpp>
#include <cstring>

#include "dbver/sqlite3_db.hpp"

using namespace dbver;

static Sqlite3Db OpenTestDb() {
  Sqlite3Db db;
  db.Open(":memory:");
  db.ExecDml("CREATE TABLE v(version_id INTEGER, is_applied INTEGER);");
  return db;
}

TEST_CASE("Sqlite3Statement: compile and exec", "[sqlite3_statement]") {
  auto db = OpenTestDb();

  auto stmt = db.CompileStatement("INSERT INTO v VALUES(?, ?);");
  REQUIRE(stmt.Valid());
  REQUIRE(stmt.ParamCount() == 2);

  REQUIRE(stmt.Bind(1, int64_t{20240101}).ok());
  REQUIRE(stmt.Bind(2, true).ok());
  REQUIRE(stmt.ExecDml() == 1);

  auto q = db.ExecQuery("SELECT version_id, is_applied FROM v;");
  REQUIRE(q.GetInt64(0) == 20240101);
  REQUIRE(q.GetInt64(1) == 1);
}

TEST_CASE("Sqlite3Statement: numbered placeholders", "[sqlite3_statement]") {
  auto db = OpenTestDb();
  Error err;
  auto stmt = db.CompileStatement("INSERT INTO v VALUES($1, $2);", &err);
  REQUIRE(err.ok());
  REQUIRE(stmt.ParamCount() == 2);
}

TEST_CASE("Sqlite3Statement: compile error", "[sqlite3_statement]") {
  auto db = OpenTestDb();
  Error err;
  auto stmt = db.CompileStatement("INSERT INTO nonexistent VALUES(?);", &err);
  REQUIRE_FALSE(err.ok());
  REQUIRE_FALSE(stmt.Valid());
}

TEST_CASE("Sqlite3Statement: bind out of range", "[sqlite3_statement]") {
  auto db = OpenTestDb();
  auto stmt = db.CompileStatement("INSERT INTO v VALUES(?, ?);");
  REQUIRE(stmt.Bind(3, int64_t{1}).code == ErrorCode::kRange);
  REQUIRE(stmt.Bind(0, false).code == ErrorCode::kRange);
}

TEST_CASE("Sqlite3Statement: bind and reset loop", "[sqlite3_statement]") {
  auto db = OpenTestDb();

  db.BeginTransaction();
  auto stmt = db.CompileStatement("INSERT INTO v VALUES(?, ?);");
  for (int64_t i = 0; i < 10; ++i) {
    stmt.Bind(1, i);
    stmt.Bind(2, i % 2 == 0);
    REQUIRE(stmt.ExecDml() == 1);
    REQUIRE(stmt.Reset().ok());
  }
  stmt.Finalize();
  db.Commit();

  auto q = db.ExecQuery("SELECT count(*), sum(is_applied) FROM v;");
  REQUIRE(q.GetInt64(0) == 10);
  REQUIRE(q.GetInt64(1) == 5);
}

TEST_CASE("Sqlite3Statement: constraint failure", "[sqlite3_statement]") {
  Sqlite3Db db;
  db.Open(":memory:");
  db.ExecDml("CREATE TABLE v(version_id INTEGER NOT NULL);");

  auto stmt = db.CompileStatement("INSERT INTO v VALUES(?);");
  Error err;
  REQUIRE(stmt.ExecDml(&err) == -1);
  REQUIRE(std::strstr(err.message, "NOT NULL") != nullptr);
}

TEST_CASE("Sqlite3Statement: uninitialized", "[sqlite3_statement]") {
  Sqlite3Statement stmt;
  REQUIRE_FALSE(stmt.Valid());
  REQUIRE(stmt.Bind(1, int64_t{1}).code == ErrorCode::kMisuse);
  REQUIRE(stmt.Reset().code == ErrorCode::kMisuse);
  Error err;
  REQUIRE(stmt.ExecDml(&err) == -1);
  REQUIRE(err.code == ErrorCode::kMisuse);
}

TEST_CASE("Sqlite3Statement: move semantics", "[sqlite3_statement]") {
  auto db = OpenTestDb();
  auto s1 = db.CompileStatement("INSERT INTO v VALUES(?, ?);");
  auto s2 = std::move(s1);
  REQUIRE(s2.Valid());
  REQUIRE_FALSE(s1.Valid());
}
