// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::VersionTableName -- name of the version-history table.
//
// Every generated statement interpolates this name. It is restricted to a
// plain, unquoted SQL identifier so it can be substituted into DDL text
// without quoting. The 48-character cap keeps the derived Oracle object
// names (<table>_id_seq, <table>_bi) within the 128-byte identifier limit
// of Oracle 12.2 and later. Servers before 12.2 allow 30 bytes, which
// needs a table name of at most 23 characters.

#pragma once

#include <cstdint>
#include <cstring>

#include "dbver/error.hpp"

namespace dbver {

class VersionTableName {
 public:
  static constexpr uint32_t kMaxLen = 48;
  static constexpr const char* kDefault = "db_version";

  VersionTableName() { std::strcpy(name_, kDefault); }

  /// Replace the name. Invalid names leave the current name untouched.
  Error Set(const char* name) {
    if (name == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "table name is null");
    }
    if (!IsValid(name)) {
      Error err;
      err.SetFormat(ErrorCode::kInvalidName,
                    "\"%.64s\": invalid version table name", name);
      return err;
    }
    std::strcpy(name_, name);
    return Error::Ok();
  }

  const char* c_str() const { return name_; }

  static bool IsValid(const char* name) {
    if (name == nullptr || name[0] == '\0') { return false; }
    uint32_t len = 0;
    for (const char* p = name; *p != '\0'; ++p, ++len) {
      if (len >= kMaxLen) { return false; }
      char c = *p;
      bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   c == '_';
      bool digit = c >= '0' && c <= '9';
      if (!alpha && !(digit && len > 0)) { return false; }
    }
    return true;
  }

 private:
  char name_[kMaxLen + 1] = {};
};

inline bool operator==(const VersionTableName& a, const VersionTableName& b) {
  return std::strcmp(a.c_str(), b.c_str()) == 0;
}

}  // namespace dbver
