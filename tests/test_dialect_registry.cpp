// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbver::DialectRegistry.

#include <catch2/catch.hpp>
#include <cstring>

#include "dbver/dialect_registry.hpp"

using namespace dbver;

TEST_CASE("DialectRegistry: defaults to postgres", "[dialect_registry]") {
  DialectRegistry registry;
  Dialect d = registry.GetActive();
  REQUIRE(d.Kind() == DialectKind::kPostgres);
  REQUIRE(std::strcmp(d.TableName(), "db_version") == 0);
}

TEST_CASE("DialectRegistry: every known name can be selected",
          "[dialect_registry]") {
  const char* names[] = {"postgres", "mysql", "sqlite3",
                         "redshift", "tidb",  "oracle"};
  DialectRegistry registry;
  for (const char* name : names) {
    INFO(name);
    REQUIRE(registry.SetActive(name).ok());
    Dialect d = registry.GetActive();
    REQUIRE(std::strcmp(d.Name(), name) == 0);

    DialectKind kind = DialectKind::kPostgres;
    REQUIRE(DialectKindFromName(name, &kind).ok());
    REQUIRE(d.CreateVersionTableSql() == Dialect(kind).CreateVersionTableSql());
  }
}

TEST_CASE("DialectRegistry: unknown name keeps previous selection",
          "[dialect_registry]") {
  DialectRegistry registry;
  REQUIRE(registry.SetActive("sqlite3").ok());

  Error err = registry.SetActive("unknown");
  REQUIRE(err.code == ErrorCode::kUnknownDialect);
  REQUIRE(std::strstr(err.message, "unknown dialect") != nullptr);
  REQUIRE(registry.GetActive().Kind() == DialectKind::kSqlite3);

  err = registry.SetActive(nullptr);
  REQUIRE(err.code == ErrorCode::kNullParam);
  REQUIRE(registry.GetActive().Kind() == DialectKind::kSqlite3);
}

TEST_CASE("DialectRegistry: handed-out dialect is a snapshot",
          "[dialect_registry]") {
  DialectRegistry registry;
  Dialect before = registry.GetActive();
  REQUIRE(registry.SetActive("oracle").ok());
  REQUIRE(before.Kind() == DialectKind::kPostgres);
  REQUIRE(registry.GetActive().Kind() == DialectKind::kOracle);
}

TEST_CASE("DialectRegistry: table name follows the selection",
          "[dialect_registry]") {
  DialectRegistry registry;
  REQUIRE(registry.SetTableName("schema_history").ok());
  REQUIRE(registry.SetActive("mysql").ok());

  Dialect d = registry.GetActive();
  REQUIRE(d.Kind() == DialectKind::kMySql);
  REQUIRE(d.InsertVersionSql().Contains("INSERT INTO schema_history "));

  REQUIRE(registry.SetTableName("bad name").code == ErrorCode::kInvalidName);
  REQUIRE(std::strcmp(registry.GetActive().TableName(), "schema_history") == 0);
}

TEST_CASE("DialectRegistry: constructed with a table name",
          "[dialect_registry]") {
  VersionTableName table;
  REQUIRE(table.Set("svc_versions").ok());
  DialectRegistry registry(table);
  REQUIRE(registry.GetActive().Kind() == DialectKind::kPostgres);
  REQUIRE(std::strcmp(registry.GetActive().TableName(), "svc_versions") == 0);
}
