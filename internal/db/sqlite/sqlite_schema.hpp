#pragma once

#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace flowstore::db::sqlite {

struct SchemaOptions {
  // kinds excluded from the (mid, kind) unique index
  std::vector<std::string> multi_valued_kinds;
  bool                     materialize_headers = true;
};

struct SchemaState {
  // header table did not exist before; caller should backfill it
  bool header_table_created = false;
};

/*
  Creates or upgrades the store schema.

  chunk and chunk_seq are the source of truth. The conditional unique index
  is dropped and recreated every time so it follows the configured
  exemption set. header is derived and disposable.
*/
SchemaState BootstrapSchema(SqliteDB& db, const SchemaOptions& options);

// Single-quoted SQL literal.
std::string QuoteLiteral(const std::string& value);

} // namespace flowstore::db::sqlite
