// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::MariaBackend -- MySQL protocol types for Database<Backend>.
//
// kDialect is mysql. A TiDB server runs on the same backend; build its
// Dialect with DialectKind::kTiDb instead of Database::NativeDialect().

#pragma once

#include "dbver/dialect.hpp"
#include "dbver/maria_db.hpp"

namespace dbver {

struct MariaBackend {
  using Db        = MariaDb;
  using Query     = MariaQuery;
  using Statement = MariaStatement;

  static constexpr DialectKind kDialect = DialectKind::kMySql;
};

}  // namespace dbver
