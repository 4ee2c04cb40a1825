#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace flowstore::db::sqlite {

/*
  SQLite transaction wrapper.

  kWrite uses BEGIN IMMEDIATE:
    - grabs write lock early
    - the read-max-seq / insert pair of the sequencer runs under it
  kRead uses a deferred BEGIN and sees one WAL snapshot.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  TxMode                       mode_;
  bool committed_ = false;
  bool finished_  = false;
};

}
