// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::MariaDsn -- "host:port:user:password:database" connection target.
//
// Every field may be left empty or omitted from the right:
//
//   "db.internal:3306:app:secret:appdb"   all fields
//   "127.0.0.1:4000:root::test"           TiDB, no password
//   ":::"                                 localhost:3306, user root
//
// Needs no client library, so DSNs can be checked before connecting.

#pragma once

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include "dbver/error.hpp"

namespace dbver {

struct MariaDsn {
  static constexpr uint16_t kDefaultPort = 3306;

  char host[128] = "localhost";
  uint16_t port = kDefaultPort;
  char user[64] = "root";
  char password[128] = {};
  char database[64] = {};

  /// Password as mysql_real_connect() wants it: nullptr when empty.
  const char* PasswordOrNull() const {
    return password[0] != '\0' ? password : nullptr;
  }

  const char* DatabaseOrNull() const {
    return database[0] != '\0' ? database : nullptr;
  }

  /// Parse into *out. On failure *out is left untouched.
  static Error Parse(const char* dsn, MariaDsn* out) {
    if (dsn == nullptr || out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "dsn is null");
    }

    MariaDsn parsed;
    const char* field = dsn;
    for (int32_t i = 0; i < 5; ++i) {
      const char* end = (i < 4) ? std::strchr(field, ':') : nullptr;
      size_t len = (end != nullptr) ? static_cast<size_t>(end - field)
                                    : std::strlen(field);
      Error err = parsed.Assign(i, field, len);
      if (!err.ok()) { return err; }
      if (end == nullptr) { break; }
      field = end + 1;
    }
    *out = parsed;
    return Error::Ok();
  }

 private:
  Error Assign(int32_t index, const char* value, size_t len) {
    if (len == 0) { return Error::Ok(); }
    switch (index) {
      case 0: return Copy(host, sizeof(host), value, len, "host");
      case 1: return SetPort(value, len);
      case 2: return Copy(user, sizeof(user), value, len, "user");
      case 3: return Copy(password, sizeof(password), value, len, "password");
      default: return Copy(database, sizeof(database), value, len, "database");
    }
  }

  static Error Copy(char* dst, size_t cap, const char* value, size_t len,
                    const char* what) {
    if (len >= cap) {
      Error err;
      err.SetFormat(ErrorCode::kRange, "dsn %s is too long", what);
      return err;
    }
    std::memcpy(dst, value, len);
    dst[len] = '\0';
    return Error::Ok();
  }

  Error SetPort(const char* value, size_t len) {
    char digits[8] = {};
    if (len >= sizeof(digits)) {
      return Error::Make(ErrorCode::kRange, "dsn port is out of range");
    }
    std::memcpy(digits, value, len);
    char* end = nullptr;
    unsigned long n = std::strtoul(digits, &end, 10);
    if (*end != '\0' || digits[0] < '0' || digits[0] > '9') {
      return Error::Make(ErrorCode::kRange, "dsn port is not a number");
    }
    if (n == 0 || n > 65535) {
      return Error::Make(ErrorCode::kRange, "dsn port is out of range");
    }
    port = static_cast<uint16_t>(n);
    return Error::Ok();
  }
};

}  // namespace dbver
