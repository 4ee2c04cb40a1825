#include "uniqueness_guard.hpp"

#include "internal/util/errors.hpp"

namespace flowstore::core {

UniquenessGuard::UniquenessGuard(std::vector<std::string> multi_valued_kinds)
    : exempt_(multi_valued_kinds.begin(), multi_valued_kinds.end()) {
}

void UniquenessGuard::Check(db::Repository& repository, db::Transaction& tx, const std::string& mid, const std::string& kind) const {
  if (IsExempt(kind)) {
    return;
  }
  if (repository.FindChunk(tx, mid, kind)) {
    throw util::DuplicateChunk(mid, kind);
  }
}

} // namespace flowstore::core
