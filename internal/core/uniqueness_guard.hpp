#pragma once

#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowstore::core {

/*
  (mid, kind) is unique among live chunks unless kind is declared
  multi-valued. The exemption set comes from configuration.
*/
class UniquenessGuard {
 public:
  explicit UniquenessGuard(std::vector<std::string> multi_valued_kinds = {});

  bool IsExempt(const std::string& kind) const {
    return exempt_.contains(kind);
  }

  const std::set<std::string>& ExemptKinds() const {
    return exempt_;
  }

  // Throws util::DuplicateChunk when a chunk of (mid, kind) is visible in tx.
  void Check(db::Repository& repository, db::Transaction& tx, const std::string& mid, const std::string& kind) const;

 private:
  std::set<std::string> exempt_;
};

} // namespace flowstore::core
