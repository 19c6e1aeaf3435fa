// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbver::Sqlite3Query.

#include <catch2/catch.hpp>
#include <cstring>

#include "dbver/sqlite3_db.hpp"

using namespace dbver;

static Sqlite3Db OpenTestDb() {
  Sqlite3Db db;
  db.Open(":memory:");
  db.ExecDml("CREATE TABLE v(version_id INTEGER, is_applied INTEGER);");
  db.ExecDml("INSERT INTO v VALUES(1, 1);");
  db.ExecDml("INSERT INTO v VALUES(2, 0);");
  db.ExecDml("INSERT INTO v VALUES(3, NULL);");
  return db;
}

TEST_CASE("Sqlite3Query: basic iteration", "[sqlite3_query]") {
  auto db = OpenTestDb();
  auto q = db.ExecQuery("SELECT * FROM v ORDER BY version_id;");

  REQUIRE_FALSE(q.Eof());
  REQUIRE(q.NumFields() == 2);
  REQUIRE(q.GetInt64(0) == 1);
  REQUIRE(std::strcmp(q.GetString(1), "1") == 0);

  q.NextRow();
  REQUIRE(q.GetInt64(0) == 2);
  q.NextRow();
  REQUIRE(q.GetInt64(0) == 3);
  q.NextRow();
  REQUIRE(q.Eof());

  // Stepping past the end is harmless.
  Error err;
  q.NextRow(&err);
  REQUIRE(q.Eof());
  REQUIRE(err.ok());
}

TEST_CASE("Sqlite3Query: null handling", "[sqlite3_query]") {
  auto db = OpenTestDb();
  auto q = db.ExecQuery("SELECT * FROM v WHERE version_id = 3;");

  REQUIRE_FALSE(q.FieldIsNull(0));
  REQUIRE(q.FieldIsNull(1));
  REQUIRE(q.GetInt64(1, 99) == 99);
  REQUIRE(q.GetString(1, nullptr) == nullptr);
  REQUIRE(q.FieldIsNull(7));
}

TEST_CASE("Sqlite3Query: large version ids", "[sqlite3_query]") {
  Sqlite3Db db;
  db.Open(":memory:");
  db.ExecDml("CREATE TABLE v(version_id INTEGER);");
  db.ExecDml("INSERT INTO v VALUES(20240131235959);");

  auto q = db.ExecQuery("SELECT version_id FROM v;");
  REQUIRE(q.GetInt64(0) == 20240131235959LL);
}

TEST_CASE("Sqlite3Query: empty result", "[sqlite3_query]") {
  auto db = OpenTestDb();
  auto q = db.ExecQuery("SELECT * FROM v WHERE version_id = 999;");
  REQUIRE(q.Eof());
}

TEST_CASE("Sqlite3Query: move semantics", "[sqlite3_query]") {
  auto db = OpenTestDb();
  auto q1 = db.ExecQuery("SELECT * FROM v ORDER BY version_id;");

  auto q2 = std::move(q1);
  REQUIRE_FALSE(q2.Eof());
  REQUIRE(q1.Eof());
  REQUIRE(q2.GetInt64(0) == 1);
}

TEST_CASE("Sqlite3Query: Finalize", "[sqlite3_query]") {
  auto db = OpenTestDb();
  auto q = db.ExecQuery("SELECT * FROM v;");
  q.Finalize();
  REQUIRE(q.Eof());
  REQUIRE(q.NumFields() == 0);
}

TEST_CASE("Sqlite3Query: step error is reported", "[sqlite3_query]") {
  Sqlite3Db db;
  db.Open(":memory:");
  db.ExecDml("CREATE TABLE v(x TEXT);");
  db.ExecDml("INSERT INTO v VALUES('1');");
  db.ExecDml("INSERT INTO v VALUES('-9223372036854775808');");

  // abs() of INT64_MIN raises "integer overflow" on the second row.
  auto q = db.ExecQuery(
      "SELECT abs(CAST(x AS INTEGER)) FROM v ORDER BY rowid;");
  REQUIRE_FALSE(q.Eof());

  Error err;
  while (!q.Eof() && err.ok()) {
    q.NextRow(&err);
  }
  REQUIRE(q.Eof());
  REQUIRE(err.code == ErrorCode::kError);
  REQUIRE(std::strstr(err.message, "integer overflow") != nullptr);
}

TEST_CASE("Sqlite3Query: error query", "[sqlite3_query]") {
  auto db = OpenTestDb();
  Error err;
  auto q = db.ExecQuery("SELECT * FROM nonexistent;", &err);
  REQUIRE_FALSE(err.ok());
  REQUIRE(q.Eof());
}
