#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace edgestore::util {

/*
  Central error types.

  Every engine failure surfaces as a subclass of Error carrying a stable
  ErrorKind. Callers branch on Kind(); the message is diagnostic only.
*/

enum class ErrorKind {
  kDuplicateVersion,
  kChecksumMismatch,
  kNotFound,
  kAlreadyExists,
  kStaleWrite,
  kInvalidPath,
  kUnauthorized,
  kTransactionAborted,
  kInvalidArgument,
  kNotInitialized,
};

inline std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kDuplicateVersion:
      return "DuplicateVersion";
    case ErrorKind::kChecksumMismatch:
      return "ChecksumMismatch";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kAlreadyExists:
      return "AlreadyExists";
    case ErrorKind::kStaleWrite:
      return "StaleWrite";
    case ErrorKind::kInvalidPath:
      return "InvalidPath";
    case ErrorKind::kUnauthorized:
      return "Unauthorized";
    case ErrorKind::kTransactionAborted:
      return "TransactionAborted";
    case ErrorKind::kInvalidArgument:
      return "InvalidArgument";
    case ErrorKind::kNotInitialized:
      return "NotInitialized";
  }
  return "Unknown";
}

class Error : public std::runtime_error {
 public:
  Error(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind Kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class DuplicateVersion : public Error {
 public:
  explicit DuplicateVersion(const std::string& msg) : Error(ErrorKind::kDuplicateVersion, msg) {
  }
};

class ChecksumMismatch : public Error {
 public:
  explicit ChecksumMismatch(const std::string& msg) : Error(ErrorKind::kChecksumMismatch, msg) {
  }
};

class NotFound : public Error {
 public:
  explicit NotFound(const std::string& msg) : Error(ErrorKind::kNotFound, msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(ErrorKind::kAlreadyExists, msg) {
  }
};

// Expected outcome of a last-writer-wins conflict; callers may retry or discard.
class StaleWrite : public Error {
 public:
  explicit StaleWrite(const std::string& msg) : Error(ErrorKind::kStaleWrite, msg) {
  }
};

class InvalidPath : public Error {
 public:
  explicit InvalidPath(const std::string& msg) : Error(ErrorKind::kInvalidPath, msg) {
  }
};

class Unauthorized : public Error {
 public:
  explicit Unauthorized(const std::string& msg) : Error(ErrorKind::kUnauthorized, msg) {
  }
};

class TransactionAborted : public Error {
 public:
  explicit TransactionAborted(const std::string& msg) : Error(ErrorKind::kTransactionAborted, msg) {
  }
};

class InvalidArgument : public Error {
 public:
  explicit InvalidArgument(const std::string& msg) : Error(ErrorKind::kInvalidArgument, msg) {
  }
};

class NotInitialized : public Error {
 public:
  explicit NotInitialized(const std::string& msg) : Error(ErrorKind::kNotInitialized, msg) {
  }
};

} // namespace edgestore::util
