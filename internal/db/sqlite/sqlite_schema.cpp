#include "sqlite_schema.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::db::sqlite {

namespace {

bool TableExists(SqliteDB& db, const std::string& name) {
  sqlite3_stmt* st = db.Prepare("SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;");
  sqlite3_bind_text(st, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  const bool exists = sqlite3_step(st) == SQLITE_ROW;
  sqlite3_finalize(st);
  return exists;
}

std::string UniqueIndexSql(const std::vector<std::string>& multi_valued_kinds) {
  std::string sql = "CREATE UNIQUE INDEX cond_mid_kind_idx ON chunk(mid, kind)";
  if (!multi_valued_kinds.empty()) {
    sql += " WHERE kind NOT IN (";
    for (std::size_t i = 0; i < multi_valued_kinds.size(); ++i) {
      if (i) sql += ",";
      sql += QuoteLiteral(multi_valued_kinds[i]);
    }
    sql += ")";
  }
  return sql + ";";
}

} // namespace

std::string QuoteLiteral(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('\'');
  for (char c : value) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

SchemaState BootstrapSchema(SqliteDB& db, const SchemaOptions& options) {
  std::lock_guard lock(db.TxMutex());
  SchemaState     state;

  db.Exec("BEGIN IMMEDIATE;");
  try {
    db.Exec(
        "CREATE TABLE IF NOT EXISTS chunk ("
        " id INTEGER PRIMARY KEY AUTOINCREMENT,"
        " mid TEXT NOT NULL,"
        " kind TEXT NOT NULL,"
        " seq INTEGER NOT NULL DEFAULT 0,"
        " data BLOB,"
        " method TEXT NOT NULL DEFAULT '');");
    db.Exec("CREATE TABLE IF NOT EXISTS chunk_seq (mid TEXT PRIMARY KEY, last_seq INTEGER NOT NULL);");

    db.Exec("CREATE INDEX IF NOT EXISTS kind_idx ON chunk(kind);");
    db.Exec("CREATE INDEX IF NOT EXISTS mid_idx ON chunk(mid);");
    db.Exec("CREATE INDEX IF NOT EXISTS idx_method ON chunk(UPPER(method)) WHERE kind = 'http_flow';");

    db.Exec("DROP INDEX IF EXISTS cond_mid_kind_idx;");
    try {
      db.Exec(UniqueIndexSql(options.multi_valued_kinds));
    } catch (const util::StorageError& e) {
      throw util::StorageError(std::string("cannot enforce (mid, kind) uniqueness: existing chunks repeat a kind that is no longer multi-valued: ") +
                               e.what());
    }

    if (options.materialize_headers) {
      state.header_table_created = !TableExists(db, "header");
      db.Exec(
          "CREATE TABLE IF NOT EXISTS header ("
          " chunk_id INTEGER NOT NULL REFERENCES chunk(id) ON DELETE CASCADE,"
          " mid TEXT NOT NULL,"
          " direction INTEGER NOT NULL,"
          " position INTEGER NOT NULL,"
          " k TEXT NOT NULL,"
          " v TEXT NOT NULL,"
          " kvstr TEXT NOT NULL,"
          " PRIMARY KEY (chunk_id, direction, position));");
      db.Exec("CREATE INDEX IF NOT EXISTS header_mid_idx ON header(mid);");
    } else {
      db.Exec("DROP TABLE IF EXISTS header;");
    }

    db.Exec("COMMIT;");
  } catch (const util::StorageError&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  FLOWSTORE_LOG_INFO("sqlite schema ready", {observability::StringField("path", db.Path()),
                                             observability::IntField("multi_valued_kinds", static_cast<int64_t>(options.multi_valued_kinds.size())),
                                             observability::BoolField("materialize_headers", options.materialize_headers)});
  return state;
}

} // namespace flowstore::db::sqlite
