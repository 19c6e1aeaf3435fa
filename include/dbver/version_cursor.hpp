// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::VersionCursor<QueryT> -- typed view over the version query.
//
// Design:
//   - Owns the backend cursor (Sqlite3Query, MariaQuery, ...)
//   - Lazy and forward-only: rows come newest first, one per Next()
//   - Row() decodes version_id and is_applied regardless of how the
//     backend stores booleans (boolean, INTEGER, CHAR(1))

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "dbver/error.hpp"

namespace dbver {

struct VersionRow {
  int64_t version_id = 0;
  bool is_applied = false;
};

inline bool operator==(const VersionRow& a, const VersionRow& b) {
  return a.version_id == b.version_id && a.is_applied == b.is_applied;
}

/// Decode a textual boolean as returned by any supported backend.
/// NULL and unrecognized text are false.
inline bool DecodeAppliedFlag(const char* text) {
  if (text == nullptr || text[0] == '\0') { return false; }
  switch (text[0]) {
    case 't': case 'T': case 'y': case 'Y':
      return true;
    case 'f': case 'F': case 'n': case 'N':
      return false;
    default:
      break;
  }
  return std::strtoll(text, nullptr, 10) != 0;
}

template <typename QueryT>
class VersionCursor {
 public:
  VersionCursor() = default;

  explicit VersionCursor(QueryT&& query) : query_(std::move(query)) {}

  VersionCursor(VersionCursor&&) noexcept = default;
  VersionCursor& operator=(VersionCursor&&) noexcept = default;

  VersionCursor(const VersionCursor&) = delete;
  VersionCursor& operator=(const VersionCursor&) = delete;

  bool Eof() const { return query_.Eof(); }

  /// Current row. Only meaningful while !Eof().
  VersionRow Row() const {
    VersionRow row;
    row.version_id = query_.GetInt64(0);
    row.is_applied = DecodeAppliedFlag(query_.GetString(1, nullptr));
    return row;
  }

  /// Advance; a failing step ends the cursor and fills *out_error.
  void Next(Error* out_error = nullptr) { query_.NextRow(out_error); }

  void Close() { query_.Finalize(); }

 private:
  QueryT query_;
};

}  // namespace dbver
