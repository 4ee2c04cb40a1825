#include "sqlite_db.hpp"

#include <memory>
#include <stdexcept>

#include <re2/re2.h>

#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

void DeleteRegex(void* p) {
  delete static_cast<RE2*>(p);
}

// The compiled pattern is cached as auxdata on argument 0, so a constant
// pattern is compiled once per statement rather than once per row.
void SearchFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  if (argc != 2 || sqlite3_value_type(argv[0]) == SQLITE_NULL || sqlite3_value_type(argv[1]) == SQLITE_NULL) {
    sqlite3_result_int(ctx, 0);
    return;
  }

  auto* re = static_cast<RE2*>(sqlite3_get_auxdata(ctx, 0));
  if (!re) {
    const auto* pattern = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
    const int   plen    = sqlite3_value_bytes(argv[0]);
    auto        fresh   = std::make_unique<RE2>(re2::StringPiece(pattern ? pattern : "", pattern ? plen : 0), RE2::Quiet);
    if (!fresh->ok()) {
      sqlite3_result_error(ctx, fresh->error().c_str(), -1);
      return;
    }
    sqlite3_set_auxdata(ctx, 0, fresh.release(), &DeleteRegex);
    // sqlite may have released it already; fetch again
    re = static_cast<RE2*>(sqlite3_get_auxdata(ctx, 0));
    if (!re) {
      sqlite3_result_error_nomem(ctx);
      return;
    }
  }

  const auto* text = reinterpret_cast<const char*>(sqlite3_value_text(argv[1]));
  const int   len  = sqlite3_value_bytes(argv[1]);
  sqlite3_result_int(ctx, RE2::PartialMatch(re2::StringPiece(text ? text : "", text ? len : 0), *re) ? 1 : 0);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageError("sqlite open " + path_ + ": " + msg);
  }

  Configure();
  RegisterFunctions();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

bool SqliteDB::IsPrivate() const {
  return path_.empty() || path_ == ":memory:" || path_.find("mode=memory") != std::string::npos;
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageError(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  if (!IsPrivate()) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // NORMAL is a good tradeoff; use FULL if you want stronger durability
  Exec("PRAGMA synchronous=NORMAL;");

  // header rows cascade with their chunk
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

void SqliteDB::RegisterFunctions() {
  ThrowIf(sqlite3_create_function_v2(db_, "search", 2, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, &SearchFunction, nullptr, nullptr, nullptr),
          db_, "register search()");
}

} // namespace flowstore::db::sqlite
