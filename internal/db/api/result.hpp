#pragma once

#include <string>

namespace pagequeue::db {

/*
  Portable persistence result codes.

  The store layer must translate I/O and parse errors into these.
  Upper layers should never depend on protobuf/filesystem error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace pagequeue::db
