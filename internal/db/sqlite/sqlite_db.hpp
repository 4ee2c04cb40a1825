#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace flowstore::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection runs at most one transaction at a time; TxMutex() is held by
  SqliteTransaction for its whole lifetime.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // true for ":memory:" and other private databases that cannot be
  // reopened from a second connection
  bool IsPrivate() const;

  std::mutex& TxMutex() {
    return tx_mu_;
  }

  // Execute a SQL string (used for pragmas and schema setup)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  // search(pattern, text): RE2 partial match, used by header search
  void RegisterFunctions();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mu_;
};

} // namespace flowstore::db::sqlite
