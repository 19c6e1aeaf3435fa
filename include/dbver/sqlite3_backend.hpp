// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Sqlite3Backend -- SQLite3 types for Database<Backend>.
//
// A file or in-memory database always speaks the sqlite3 dialect.

#pragma once

#include "dbver/dialect.hpp"
#include "dbver/sqlite3_db.hpp"

namespace dbver {

struct Sqlite3Backend {
  using Db        = Sqlite3Db;
  using Query     = Sqlite3Query;
  using Statement = Sqlite3Statement;

  static constexpr DialectKind kDialect = DialectKind::kSqlite3;
};

}  // namespace dbver
