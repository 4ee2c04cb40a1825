#pragma once

namespace flowstore::db {

enum class TxMode {
  kRead,
  kWrite,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - kRead transactions see one committed snapshot and never block writers

  SQLite: BEGIN IMMEDIATE (write) / BEGIN on a reader connection (read)
  Memory: snapshot copy-on-write
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual TxMode Mode() const = 0;
};

}
