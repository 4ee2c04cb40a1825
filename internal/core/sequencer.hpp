#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace flowstore::core {

/*
  Per-mid sequence assignment.

  CRITICAL GUARANTEES:

  - Runs inside the caller's kWrite transaction, so read-last / record-next
    commit or roll back together with the chunk insert
  - The first chunk of a mid gets 1, every later one last + 1
  - Values are never reused, even after the chunks holding them are deleted

  A value that is not above the previous maximum is a broken store
  invariant and raises util::InvariantViolation.
*/
class Sequencer {
 public:
  explicit Sequencer(db::Repository& repository) : repository_(repository) {
  }

  uint64_t Assign(db::Transaction& tx, const std::string& mid);

 private:
  db::Repository& repository_;
};

} // namespace flowstore::core
