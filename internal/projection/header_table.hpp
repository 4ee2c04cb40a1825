#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/header_record.hpp"

namespace flowstore::projection {

enum class HeaderMatch {
  // ASCII case-insensitive substring of "key=value"
  kSubstring,
  // RE2 regex searched in "key=value", case-sensitive
  kRegex,
};

struct HeaderSearch {
  // empty matches every row
  std::string                                   pattern;
  HeaderMatch                                   mode = HeaderMatch::kSubstring;
  std::optional<db::model::HeaderDirection>     direction;
  std::optional<std::string>                    mid;
};

/*
  Header table: one row per request or response header of every http_flow
  chunk, ordered by (chunk_id, direction, position).

  Materialized: rows are persisted by the chunk store in the same
  transaction as the payload and searched in the database.
  Otherwise: rows are recomputed from the payloads on every call.
*/
class HeaderTable {
 public:
  HeaderTable(std::shared_ptr<db::Repository> repository, bool materialized);

  std::vector<db::model::HeaderRecord> Rows(const std::optional<std::string>& mid = std::nullopt);

  // Throws util::InvalidArgument for an invalid regex.
  std::vector<db::model::HeaderRecord> Search(const HeaderSearch& search);

 private:
  std::vector<db::model::HeaderRecord> Computed(db::Transaction& tx, const db::HeaderQuery& query);

  std::shared_ptr<db::Repository> repository_;
  bool                            materialized_;
};

} // namespace flowstore::projection
