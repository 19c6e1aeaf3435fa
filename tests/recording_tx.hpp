// Copyright (c) 2024 liudegui. MIT License.
// Test double: a transaction that records statements instead of running
// them, optionally failing at a chosen statement.

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dbver/error.hpp"

namespace dbver {
namespace testing {

class RecordingTx {
 public:
  /// fail_at: 0-based index of the statement to fail, -1 for none.
  explicit RecordingTx(int32_t fail_at = -1,
                       const char* fail_message = "simulated failure")
      : fail_at_(fail_at), fail_message_(fail_message) {}

  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    int32_t index = static_cast<int32_t>(statements.size());
    statements.emplace_back(sql);
    if (index == fail_at_) {
      ReportError(out_error, ErrorCode::kError, fail_message_);
      return -1;
    }
    return 0;
  }

  Error Commit() {
    ++commits;
    return Error::Ok();
  }

  Error Rollback() {
    ++rollbacks;
    return Error::Ok();
  }

  std::vector<std::string> statements;
  int32_t commits = 0;
  int32_t rollbacks = 0;

 private:
  int32_t fail_at_;
  const char* fail_message_;
};

}  // namespace testing
}  // namespace dbver
