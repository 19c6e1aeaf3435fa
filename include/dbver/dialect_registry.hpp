// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::DialectRegistry -- selection of the active dialect.
//
// Design:
//   - Plain object owned by the runner, no process-global state
//   - Starts at postgres; SetActive() validates against the known names
//   - A rejected name leaves the previous selection in place
//   - GetActive() hands out an immutable Dialect value
//   - Not synchronized: one registry per runner

#pragma once

#include <spdlog/spdlog.h>

#include "dbver/dialect.hpp"
#include "dbver/error.hpp"
#include "dbver/table_name.hpp"

namespace dbver {

class DialectRegistry {
 public:
  static constexpr DialectKind kDefaultKind = DialectKind::kPostgres;

  DialectRegistry() : active_(kDefaultKind) {}

  explicit DialectRegistry(const VersionTableName& table)
      : active_(kDefaultKind, table) {}

  Dialect GetActive() const { return active_; }

  Error SetActive(const char* name) {
    DialectKind kind = active_.Kind();
    Error err = DialectKindFromName(name, &kind);
    if (!err.ok()) { return err; }
    active_ = Dialect(kind, active_.Table());
    SPDLOG_INFO("active dialect set to {}", active_.Name());
    return Error::Ok();
  }

  /// Rename the version table while keeping the selected backend.
  Error SetTableName(const char* name) {
    VersionTableName table = active_.Table();
    Error err = table.Set(name);
    if (!err.ok()) { return err; }
    active_ = Dialect(active_.Kind(), table);
    return Error::Ok();
  }

 private:
  Dialect active_;
};

}  // namespace dbver
