#pragma once

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rowcast::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  // backend derives this data from its own catalog and cannot store it
  Unsupported,
  InternalError
};

const char* ErrorCodeName(ErrorCode code);

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

  std::string ToString() const {
    return message.empty() ? ErrorCodeName(code) : std::string(ErrorCodeName(code)) + ": " + message;
  }
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::AlreadyExists:
      return "AlreadyExists";
    case ErrorCode::Busy:
      return "Busy";
    case ErrorCode::ConstraintViolation:
      return "ConstraintViolation";
    case ErrorCode::SerializationFailure:
      return "SerializationFailure";
    case ErrorCode::IOError:
      return "IOError";
    case ErrorCode::Corruption:
      return "Corruption";
    case ErrorCode::Unsupported:
      return "Unsupported";
    case ErrorCode::InternalError:
      return "InternalError";
  }
  return "Unknown";
}

// Raises the util:: error matching a failed result; no-op on success.
inline void ThrowIfError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = context + ": " + result.ToString();
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::Unavailable(message);
    case ErrorCode::Unsupported:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace rowcast::db
