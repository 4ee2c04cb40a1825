#include "sqlite_pool.hpp"

namespace flowstore::db::sqlite {

SqliteReaderPool::SqliteReaderPool(std::string path, std::size_t max_connections)
    : path_(std::move(path)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<SqliteDB> SqliteReaderPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          return Wrap(new SqliteDB(path_));
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::shared_ptr<SqliteDB> SqliteReaderPool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqliteReaderPool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqliteReaderPool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace flowstore::db::sqlite
