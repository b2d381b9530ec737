#pragma once

#include <stdexcept>
#include <string>

namespace jobguard::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Expected outcomes
  (claim held elsewhere, unrecoverable session) are returned as values
  and never use these.
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

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

// Backend rejected a commit because a concurrent writer won.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The checkpoint filesystem failed an operation (permissions, stat, short read).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Encoded state violates the value model (bad decimal, unset kind, ...).
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Stored checkpoint / snapshot bytes do not match their metadata.
  The affected recovery point must never be used again.
*/
class IntegrityError : public std::runtime_error {
 public:
  enum class Kind {
    kMissing,
    kSizeMismatch,
    kChecksumMismatch,
    kUndecodable,
  };

  IntegrityError(Kind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  Kind kind() const {
    return kind_;
  }

 private:
  Kind kind_;
};

} // namespace jobguard::util
