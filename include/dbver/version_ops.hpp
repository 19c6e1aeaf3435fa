// Copyright (c) 2024 liudegui. MIT License.
//
// dbver version table operations that touch a connection.
//
//   DbVersionQuery(dialect, db, &err)  -> VersionCursor, newest row first
//   DbRunAux(dialect, tx)              -> Error, post-create setup
//
// Both are templates over the connection type, so they work with any
// backend exposing ExecQuery()/ExecDml() with the dbver signatures.
// The caller owns the connection and the transaction.

#pragma once

#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>

#include "dbver/dialect.hpp"
#include "dbver/error.hpp"
#include "dbver/sql_text.hpp"
#include "dbver/transaction.hpp"
#include "dbver/version_cursor.hpp"

namespace dbver {

template <typename DbT>
using QueryOf = decltype(std::declval<DbT&>().ExecQuery(nullptr, nullptr));

/// Run SELECT version_id, is_applied ... ORDER BY id DESC.
/// On failure the connection's message lands in *out_error verbatim and the
/// returned cursor is already at Eof().
template <typename DbT>
VersionCursor<QueryOf<DbT>> DbVersionQuery(const Dialect& dialect, DbT& db,
                                           Error* out_error = nullptr) {
  SqlText sql = dialect.VersionQuerySql();
  return VersionCursor<QueryOf<DbT>>(db.ExecQuery(sql.c_str(), out_error));
}

/// Post-create setup inside the caller's open transaction.
///
/// Native auto-increment backends have no steps and return immediately
/// without touching tx. Oracle runs primary key, sequence, trigger in that
/// order; the first failing step stops the pipeline and is returned as
/// kAuxStep "<step>: <backend message>". tx is never committed or rolled
/// back here.
template <typename TxT>
Error DbRunAux(const Dialect& dialect, TxT& tx) {
  AuxPlan plan = dialect.AuxSteps();
  for (uint32_t i = 0; i < plan.count; ++i) {
    const AuxStep& step = plan.steps[i];
    SPDLOG_DEBUG("{} aux {}: {}", dialect.Name(), step.label,
                 step.sql.c_str());
    Error err;
    tx.ExecDml(step.sql.c_str(), &err);
    if (!err.ok()) {
      SPDLOG_ERROR("{} aux step '{}' failed on {}: {}", dialect.Name(),
                   step.label, dialect.TableName(), err.message);
      return Error::Wrap(ErrorCode::kAuxStep, step.label, err);
    }
  }
  return Error::Ok();
}

}  // namespace dbver
