// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::SqlText -- fixed-capacity SQL statement buffer.
//
// Design:
//   - Value type, no heap allocation
//   - Built once by the dialect layer via printf-style formatting
//   - Capacity covers the longest statement at the longest table name

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dbver {

// ---------------------------------------------------------------------------
// SqlText
// ---------------------------------------------------------------------------

struct SqlText {
  static constexpr uint32_t kMaxLen = 512;

  char text[kMaxLen] = {};

  const char* c_str() const { return text; }
  uint32_t size() const { return static_cast<uint32_t>(std::strlen(text)); }
  bool empty() const { return text[0] == '\0'; }

  bool Contains(const char* needle) const {
    return needle != nullptr && std::strstr(text, needle) != nullptr;
  }

  static SqlText Format(const char* fmt, ...) {
    SqlText out;
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(out.text, kMaxLen, fmt, ap);
    va_end(ap);
    return out;
  }
};

inline bool operator==(const SqlText& a, const SqlText& b) {
  return std::strcmp(a.text, b.text) == 0;
}

inline bool operator!=(const SqlText& a, const SqlText& b) {
  return !(a == b);
}

}  // namespace dbver
