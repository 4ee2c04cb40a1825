#include "sequencer.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::core {

uint64_t Sequencer::Assign(db::Transaction& tx, const std::string& mid) {
  if (tx.Mode() != db::TxMode::kWrite) {
    throw util::InvariantViolation("sequence assigned outside a write transaction");
  }

  const uint64_t last = repository_.LastSeq(tx, mid);
  const uint64_t next = last + 1;
  if (next <= last) {
    throw util::InvariantViolation("sequence overflow for mid " + mid);
  }

  auto result = repository_.RecordSeq(tx, mid, next);
  if (result.code == db::ErrorCode::Conflict) {
    throw util::InvariantViolation("sequence race for mid " + mid + ": " + result.message);
  }
  ThrowIfDbError(result, "record seq");

  return next;
}

} // namespace flowstore::core
