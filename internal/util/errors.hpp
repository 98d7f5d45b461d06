#pragma once

#include <stdexcept>
#include <string>

namespace rowcast::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
  Per-subscriber failures are NOT exceptions; they are recorded
  as VisibilityError values on the VisibilityResult.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Downstream could not take the event right now; retry later.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class DecodeErrorCode {
  kMalformed,
  kUnknownKind,
  kUnexpectedField,
  kMissingField,
  kInvalidValue,
};

const char* DecodeErrorCodeName(DecodeErrorCode code);

class DecodeError : public std::runtime_error {
 public:
  DecodeError(DecodeErrorCode code, const std::string& msg)
      : std::runtime_error(std::string(DecodeErrorCodeName(code)) + ": " + msg), code_(code) {
  }

  DecodeErrorCode code() const {
    return code_;
  }

 private:
  DecodeErrorCode code_;
};

// The host security engine failed to evaluate a whole admission batch.
class AdmissionError : public std::runtime_error {
 public:
  explicit AdmissionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AdmissionTimeout : public AdmissionError {
 public:
  explicit AdmissionTimeout(const std::string& msg) : AdmissionError(msg) {
  }
};

inline const char* DecodeErrorCodeName(DecodeErrorCode code) {
  switch (code) {
    case DecodeErrorCode::kMalformed:
      return "Malformed";
    case DecodeErrorCode::kUnknownKind:
      return "UnknownKind";
    case DecodeErrorCode::kUnexpectedField:
      return "UnexpectedField";
    case DecodeErrorCode::kMissingField:
      return "MissingField";
    case DecodeErrorCode::kInvalidValue:
      return "InvalidValue";
  }
  return "Unknown";
}

} // namespace rowcast::util
