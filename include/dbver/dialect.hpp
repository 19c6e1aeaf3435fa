// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Dialect -- backend-specific SQL for the version-history table.
//
// Design:
//   - DialectKind tags the backend; behaviour is looked up in a constant
//     table of function pointers (no virtual dispatch)
//   - Dialect is an immutable value: kind + version table name
//   - SQL text methods are pure, never touch a connection
//   - Backends without native auto-increment describe their post-create
//     setup as an ordered list of AuxStep; version_ops.hpp executes it
//
// Adding a backend: one enumerator, one DialectOps row, one name.

#pragma once

#include <cstdint>
#include <cstring>

#include "dbver/error.hpp"
#include "dbver/sql_text.hpp"
#include "dbver/table_name.hpp"

namespace dbver {

// ---------------------------------------------------------------------------
// DialectKind
// ---------------------------------------------------------------------------

enum class DialectKind : uint8_t {
  kPostgres = 0,
  kMySql,
  kSqlite3,
  kRedshift,
  kTiDb,
  kOracle,
};

constexpr uint32_t kDialectCount = 6;

enum class PlaceholderStyle : uint8_t {
  kNumbered,    // $1, $2
  kPositional,  // ?, ?
};

/// One post-create DDL statement; label names the step in errors and logs.
struct AuxStep {
  const char* label = nullptr;
  SqlText sql;
};

/// Oracle needs primary key, sequence and trigger.
constexpr uint32_t kMaxAuxSteps = 3;

struct AuxPlan {
  AuxStep steps[kMaxAuxSteps];
  uint32_t count = 0;
};

namespace detail {

// ---------------------------------------------------------------------------
// Per-backend SQL
// ---------------------------------------------------------------------------

inline SqlText PostgresCreate(const char* t) {
  return SqlText::Format(
      "CREATE TABLE %s (id serial NOT NULL, version_id bigint NOT NULL, "
      "is_applied boolean NOT NULL, tstamp timestamp NULL DEFAULT now(), "
      "PRIMARY KEY(id));", t);
}

// MySQL accepts SERIAL (BIGINT UNSIGNED NOT NULL AUTO_INCREMENT UNIQUE),
// so the Postgres text is valid as is.
inline SqlText MySqlCreate(const char* t) { return PostgresCreate(t); }

inline SqlText Sqlite3Create(const char* t) {
  return SqlText::Format(
      "CREATE TABLE %s (id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "version_id INTEGER NOT NULL, is_applied INTEGER NOT NULL, "
      "tstamp TIMESTAMP DEFAULT (datetime('now')));", t);
}

inline SqlText RedshiftCreate(const char* t) {
  return SqlText::Format(
      "CREATE TABLE %s (id integer NOT NULL identity(1, 1), "
      "version_id bigint NOT NULL, is_applied boolean NOT NULL, "
      "tstamp timestamp NULL DEFAULT sysdate, PRIMARY KEY(id));", t);
}

inline SqlText TiDbCreate(const char* t) {
  return SqlText::Format(
      "CREATE TABLE %s (id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT UNIQUE, "
      "version_id bigint NOT NULL, is_applied boolean NOT NULL, "
      "tstamp timestamp NULL DEFAULT now(), PRIMARY KEY(id));", t);
}

// Oracle DDL must not end in ';' when sent through a client API.
inline SqlText OracleCreate(const char* t) {
  return SqlText::Format(
      "CREATE TABLE %s (id NUMBER(19), version_id NUMBER(19) NOT NULL, "
      "is_applied CHAR(1) NOT NULL, "
      "tstamp TIMESTAMP(6) DEFAULT SYS_EXTRACT_UTC(SYSTIMESTAMP))", t);
}

inline SqlText NumberedInsert(const char* t) {
  return SqlText::Format(
      "INSERT INTO %s (version_id, is_applied) VALUES ($1, $2);", t);
}

inline SqlText PositionalInsert(const char* t) {
  return SqlText::Format(
      "INSERT INTO %s (version_id, is_applied) VALUES (?, ?);", t);
}

inline SqlText OracleInsert(const char* t) {
  return SqlText::Format(
      "INSERT INTO %s (version_id, is_applied) VALUES (?, ?)", t);
}

inline void NoAux(const char*, AuxPlan* plan) { plan->count = 0; }

// The trigger body is PL/SQL, so its trailing ';' belongs to the block.
inline void OracleAux(const char* t, AuxPlan* plan) {
  plan->steps[0].label = "add primary key";
  plan->steps[0].sql = SqlText::Format(
      "ALTER TABLE %s ADD PRIMARY KEY (id)", t);
  plan->steps[1].label = "create sequence";
  plan->steps[1].sql = SqlText::Format("CREATE SEQUENCE %s_id_seq", t);
  plan->steps[2].label = "create trigger";
  plan->steps[2].sql = SqlText::Format(
      "CREATE OR REPLACE TRIGGER %s_bi BEFORE INSERT ON %s "
      "FOR EACH ROW BEGIN IF :NEW.id IS NULL THEN "
      "SELECT %s_id_seq.NEXTVAL INTO :NEW.id FROM dual; END IF; END;",
      t, t, t);
  plan->count = 3;
}

// ---------------------------------------------------------------------------
// Dispatch table, indexed by DialectKind
// ---------------------------------------------------------------------------

struct DialectOps {
  const char* name;
  PlaceholderStyle placeholders;
  SqlText (*create_table)(const char* table);
  SqlText (*insert_version)(const char* table);
  void (*aux_plan)(const char* table, AuxPlan* plan);
};

inline const DialectOps& OpsFor(DialectKind kind) {
  static const DialectOps kOps[kDialectCount] = {
      {"postgres", PlaceholderStyle::kNumbered,
       &PostgresCreate, &NumberedInsert, &NoAux},
      {"mysql", PlaceholderStyle::kPositional,
       &MySqlCreate, &PositionalInsert, &NoAux},
      {"sqlite3", PlaceholderStyle::kPositional,
       &Sqlite3Create, &PositionalInsert, &NoAux},
      {"redshift", PlaceholderStyle::kNumbered,
       &RedshiftCreate, &NumberedInsert, &NoAux},
      {"tidb", PlaceholderStyle::kPositional,
       &TiDbCreate, &PositionalInsert, &NoAux},
      {"oracle", PlaceholderStyle::kPositional,
       &OracleCreate, &OracleInsert, &OracleAux},
  };
  return kOps[static_cast<uint32_t>(kind)];
}

}  // namespace detail

// ---------------------------------------------------------------------------
// Name lookup
// ---------------------------------------------------------------------------

inline const char* DialectName(DialectKind kind) {
  return detail::OpsFor(kind).name;
}

/// Resolve a configuration identifier. Returns kUnknownDialect for anything
/// outside the six known names; *out is written only on success.
inline Error DialectKindFromName(const char* name, DialectKind* out) {
  if (name == nullptr) {
    return Error::Make(ErrorCode::kNullParam, "dialect name is null");
  }
  for (uint32_t i = 0; i < kDialectCount; ++i) {
    DialectKind kind = static_cast<DialectKind>(i);
    if (std::strcmp(name, DialectName(kind)) == 0) {
      if (out != nullptr) { *out = kind; }
      return Error::Ok();
    }
  }
  Error err;
  err.SetFormat(ErrorCode::kUnknownDialect, "\"%.64s\": unknown dialect",
                name);
  return err;
}

// ---------------------------------------------------------------------------
// Dialect
// ---------------------------------------------------------------------------

class Dialect {
 public:
  Dialect() = default;

  explicit Dialect(DialectKind kind) : kind_(kind) {}

  Dialect(DialectKind kind, const VersionTableName& table)
      : kind_(kind), table_(table) {}

  DialectKind Kind() const { return kind_; }
  const char* Name() const { return DialectName(kind_); }
  const char* TableName() const { return table_.c_str(); }
  const VersionTableName& Table() const { return table_; }

  PlaceholderStyle Placeholders() const {
    return detail::OpsFor(kind_).placeholders;
  }

  /// DDL creating the version table with id, version_id, is_applied, tstamp.
  SqlText CreateVersionTableSql() const {
    return detail::OpsFor(kind_).create_table(table_.c_str());
  }

  /// INSERT with two parameters: version_id, is_applied.
  SqlText InsertVersionSql() const {
    return detail::OpsFor(kind_).insert_version(table_.c_str());
  }

  /// Newest-first event log, identical across backends.
  SqlText VersionQuerySql() const {
    return SqlText::Format(
        "SELECT version_id, is_applied FROM %s ORDER BY id DESC",
        table_.c_str());
  }

  /// Ordered post-create statements; empty for native auto-increment.
  AuxPlan AuxSteps() const {
    AuxPlan plan;
    detail::OpsFor(kind_).aux_plan(table_.c_str(), &plan);
    return plan;
  }

  bool NeedsAux() const { return AuxSteps().count > 0; }

 private:
  DialectKind kind_ = DialectKind::kPostgres;
  VersionTableName table_;
};

}  // namespace dbver
