#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace flowstore::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, TxMode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  snapshot_         = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
  if (mode_ == TxMode::kWrite) {
    // copies node pointers; nodes are copied on first write
    working_             = std::make_unique<MemoryRepository::State>(*snapshot_);
    working_->generation = ++repo_.generations_;
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    throw util::StorageError("write attempted in a read-only transaction");
  }
  return *working_;
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::StorageError("transaction already finished");
  }
  if (!working_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw util::StorageError("transaction conflict: state was modified by a concurrent transaction");
  }
  repo_.committed_ = std::shared_ptr<const MemoryRepository::State>(std::move(working_));
  repo_.committed_version_++;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_.reset();
  rolled_back_ = true;
}

} // namespace flowstore::db::memory
