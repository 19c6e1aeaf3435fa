// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Config -- dialect selector and version table name.
//
// Environment:
//   DBVER_DIALECT  -- postgres | mysql | sqlite3 | redshift | tidb | oracle
//                     (default "postgres")
//   DBVER_TABLE    -- version table name (default "db_version")
//
// Usage:
//   dbver::Config cfg = dbver::Config::FromEnv();
//   dbver::Dialect dialect;
//   dbver::Error err = cfg.Resolve(&dialect);

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "dbver/dialect.hpp"
#include "dbver/error.hpp"
#include "dbver/table_name.hpp"

namespace dbver {

struct Config {
  static constexpr uint32_t kMaxValueLen = 64;

  char dialect[kMaxValueLen] = "postgres";
  char table[kMaxValueLen] = "db_version";

  static Config FromEnv() {
    Config cfg;
    CopyEnv("DBVER_DIALECT", cfg.dialect);
    CopyEnv("DBVER_TABLE", cfg.table);
    return cfg;
  }

  /// Validate both values and build the Dialect the runner threads through.
  /// *out is untouched on failure.
  Error Resolve(Dialect* out) const {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    DialectKind kind = DialectKind::kPostgres;
    Error err = DialectKindFromName(dialect, &kind);
    if (!err.ok()) { return err; }

    VersionTableName name;
    err = name.Set(table);
    if (!err.ok()) { return err; }

    *out = Dialect(kind, name);
    return Error::Ok();
  }

 private:
  static void CopyEnv(const char* var, char (&dst)[kMaxValueLen]) {
    const char* value = std::getenv(var);
    if (value == nullptr || value[0] == '\0') { return; }
    std::strncpy(dst, value, kMaxValueLen - 1);
    dst[kMaxValueLen - 1] = '\0';
  }
};

}  // namespace dbver
