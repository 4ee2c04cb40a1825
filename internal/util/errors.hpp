#pragma once

#include <stdexcept>
#include <string>

namespace flowstore::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A second chunk of a non-exempt kind for the same message id.
class DuplicateChunk : public ConstraintViolation {
 public:
  DuplicateChunk(std::string mid, std::string kind)
      : ConstraintViolation("duplicate chunk: mid=" + mid + " kind=" + kind + " already exists; replace it or declare the kind multi-valued"),
        mid_(std::move(mid)),
        kind_(std::move(kind)) {
  }

  const std::string& mid() const {
    return mid_;
  }
  const std::string& kind() const {
    return kind_;
  }

 private:
  std::string mid_;
  std::string kind_;
};

class MalformedPayload : public std::runtime_error {
 public:
  explicit MalformedPayload(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Broken store invariant (e.g. a sequence number that does not increase).
  Never handled; callers let it terminate the operation.
*/
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace flowstore::util
