// Copyright (c) 2024 liudegui. MIT License.
//
// dbver::Error -- error handling without exceptions.
//
// Every fallible dbver call returns an Error or fills an optional Error*.
// Messages from the database client are copied unmodified, so a caller
// sees exactly what the server said; Wrap() only prefixes a label such as
// an auxiliary step name. Nothing in dbver throws.

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dbver {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kMisuse = -7,
  kRange = -8,
  kNullParam = -9,
  kUnknownDialect = -20,
  kInvalidName = -21,
  kAuxStep = -22,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:             return "ok";
    case ErrorCode::kError:          return "error";
    case ErrorCode::kNotOpen:        return "not open";
    case ErrorCode::kMisuse:         return "misuse";
    case ErrorCode::kRange:          return "out of range";
    case ErrorCode::kNullParam:      return "null parameter";
    case ErrorCode::kUnknownDialect: return "unknown dialect";
    case ErrorCode::kInvalidName:    return "invalid name";
    case ErrorCode::kAuxStep:        return "auxiliary step failed";
  }
  return "unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }

  /// Compose "<label>: <cause message>" under a new code.
  static Error Wrap(ErrorCode c, const char* label, const Error& cause) {
    Error e;
    e.SetFormat(c, "%s: %s", label != nullptr ? label : "", cause.message);
    return e;
  }
};

/// Store an error into an optional out parameter.
inline void ReportError(Error* out_error, ErrorCode c, const char* msg) {
  if (out_error != nullptr) { out_error->Set(c, msg); }
}

}  // namespace dbver
