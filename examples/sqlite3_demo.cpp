// Copyright (c) 2024 liudegui. MIT License.
//
// dbver SQLite3 demo -- version table bookkeeping on a local database.
//
// Usage:
//   ./dbver_sqlite3_demo [db_path]
//
// Environment:
//   DBVER_TABLE -- version table name (default "db_version")

#include <cstdint>
#include <cstdio>

#include "dbver/config.hpp"
#include "dbver/db.hpp"
#include "dbver/version_ops.hpp"
#include "dbver/version_store.hpp"

int main(int argc, char** argv) {
  const char* path = (argc > 1) ? argv[1] : ":memory:";

  dbver::Config cfg = dbver::Config::FromEnv();
  std::snprintf(cfg.dialect, sizeof(cfg.dialect), "%s",
                dbver::DialectName(dbver::Db::kDialect));

  dbver::Dialect dialect;
  dbver::Error err = cfg.Resolve(&dialect);
  if (!err.ok()) {
    std::fprintf(stderr, "Config: %s\n", err.message);
    return 1;
  }

  dbver::Db db;
  err = db.Open(path);
  if (!err.ok()) {
    std::fprintf(stderr, "Open failed: %s\n", err.message);
    return 1;
  }

  dbver::VersionStore<dbver::Db> store(db, dialect);
  err = store.EnsureVersionTable();
  if (!err.ok()) {
    std::fprintf(stderr, "EnsureVersionTable: %s\n", err.message);
    return 1;
  }
  std::printf("Version table: %s\n", dialect.TableName());

  // Simulated migration history.
  const int64_t kVersions[] = {20240101120000, 20240102120000, 20240103120000};
  for (int64_t v : kVersions) {
    err = store.RecordApplied(v);
    if (!err.ok()) {
      std::fprintf(stderr, "RecordApplied %lld: %s\n",
                   static_cast<long long>(v), err.message);
      return 1;
    }
  }
  err = store.RecordRolledBack(kVersions[2]);
  if (!err.ok()) {
    std::fprintf(stderr, "RecordRolledBack: %s\n", err.message);
    return 1;
  }

  int64_t current = 0;
  err = store.CurrentVersion(&current);
  if (!err.ok()) {
    std::fprintf(stderr, "CurrentVersion: %s\n", err.message);
    return 1;
  }
  std::printf("Current version: %lld\n", static_cast<long long>(current));

  std::printf("\n--- History (newest first) ---\n");
  auto cursor = dbver::DbVersionQuery(dialect, db, &err);
  for (; !cursor.Eof(); cursor.Next(&err)) {
    dbver::VersionRow row = cursor.Row();
    std::printf("  %lld  %s\n", static_cast<long long>(row.version_id),
                row.is_applied ? "applied" : "rolled back");
  }
  if (!err.ok()) {
    std::fprintf(stderr, "History: %s\n", err.message);
    return 1;
  }
  cursor.Close();

  db.Close();
  std::printf("\nDone.\n");
  return 0;
}
