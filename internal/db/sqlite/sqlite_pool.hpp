#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace flowstore::db::sqlite {

/*
  SqliteReaderPool

  Reader connections for kRead transactions.

  Design notes:
  -------------
  - WAL mode lets each reader see a committed snapshot while the single
    writer connection appends.
  - A connection is handed to one transaction at a time and returned to the
    idle list when the last shared_ptr drops.
  - Private databases (":memory:") cannot be reopened; the pool is then
    never constructed and reads go through the writer connection.
*/

class SqliteReaderPool : public std::enable_shared_from_this<SqliteReaderPool> {
 public:
  explicit SqliteReaderPool(std::string path, std::size_t max_connections = 4);

  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string path_;
  std::size_t max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace flowstore::db::sqlite
