#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace flowstore::db::memory {

/*
  Transaction = snapshot + write set

  kRead holds the committed snapshot without copying it.
  kWrite takes a shallow copy and publishes it on Commit().
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, TxMode mode);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  TxMode Mode() const override {
    return mode_;
  }

  // throws util::StorageError on a kRead transaction
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

 private:
  MemoryRepository&                              repo_;
  TxMode                                         mode_;
  std::shared_ptr<const MemoryRepository::State> snapshot_;
  std::unique_ptr<MemoryRepository::State>       working_;
  uint64_t                                       snapshot_version_ = 0;
  bool                                           committed_        = false;
  bool                                           rolled_back_      = false;
};

} // namespace flowstore::db::memory
