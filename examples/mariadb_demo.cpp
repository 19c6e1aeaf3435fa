// Copyright (c) 2024 liudegui. MIT License.
//
// dbver MariaDB demo -- version table on MySQL/MariaDB or TiDB.
//
// Usage:
//   export DBVER_MARIA_DSN="localhost:3306:root:pass:dbver_test"
//   export DBVER_DIALECT=mysql        # or tidb
//   ./dbver_mariadb_demo
//
// Before running, create the database:
//   mysql -u root -e "CREATE DATABASE IF NOT EXISTS dbver_test;"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include "dbver/config.hpp"
#include "dbver/db.hpp"
#include "dbver/dialect_registry.hpp"
#include "dbver/version_store.hpp"

int main() {
  const char* dsn = std::getenv("DBVER_MARIA_DSN");
  if (dsn == nullptr) {
    dsn = "localhost:3306:root::dbver_test";
  }

  dbver::Config cfg = dbver::Config::FromEnv();
  dbver::DialectRegistry registry;
  dbver::Error err = registry.SetTableName(cfg.table);
  if (err.ok()) { err = registry.SetActive(cfg.dialect); }
  if (!err.ok()) {
    std::fprintf(stderr, "Config: %s\n", err.message);
    return 1;
  }
  dbver::Dialect dialect = registry.GetActive();
  if (dialect.Kind() != dbver::DialectKind::kMySql &&
      dialect.Kind() != dbver::DialectKind::kTiDb) {
    std::fprintf(stderr, "Dialect %s does not run on a MySQL connection\n",
                 dialect.Name());
    return 1;
  }

  dbver::MDb db;
  err = db.Open(dsn);
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }
  std::printf("Connected, dialect %s\n", dialect.Name());

  dbver::VersionStore<dbver::MDb> store(db, dialect);
  err = store.EnsureVersionTable();
  if (!err.ok()) {
    std::fprintf(stderr, "EnsureVersionTable: %s\n", err.message);
    return 1;
  }

  err = store.RecordApplied(1);
  if (err.ok()) { err = store.RecordApplied(2); }
  if (!err.ok()) {
    std::fprintf(stderr, "Record: %s\n", err.message);
    return 1;
  }

  int64_t current = 0;
  err = store.CurrentVersion(&current);
  if (!err.ok()) {
    std::fprintf(stderr, "CurrentVersion: %s\n", err.message);
    return 1;
  }
  std::printf("Current version: %lld\n", static_cast<long long>(current));

  db.Close();
  std::printf("Done.\n");
  return 0;
}
