#pragma once

#include <string>
#include <string_view>

namespace reactor::db {

/*
  Store-neutral failure codes.

  Each backend maps its own errors onto these (sqlite: SQLITE_BUSY
  -> Busy, SQLITE_CONSTRAINT -> ConstraintViolation, ...). Nothing
  above the repository layer sees a backend error type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // row addressed by id does not exist
  Busy,                // store locked by another connection
  ConstraintViolation, // schema constraint rejected the write
  IOError,
  Corruption,
  InternalError
};

inline std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
}

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

  // "<code>: <message>", or just the code name.
  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) out += ": " + message;
    return out;
  }
};

} // namespace reactor::db
