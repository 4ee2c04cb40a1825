#include "internal/projection/header_table.hpp"

#include <algorithm>
#include <cctype>
#include <memory>

#include <re2/re2.h>

#include "internal/codec/flow_payload.hpp"
#include "internal/codec/kinds.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::projection {

namespace {

bool ContainsNoCase(const std::string& haystack, const std::string& needle) {
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](unsigned char a, unsigned char b) {
    return std::tolower(a) == std::tolower(b);
  });
  return it != haystack.end();
}

} // namespace

HeaderTable::HeaderTable(std::shared_ptr<db::Repository> repository, bool materialized)
    : repository_(std::move(repository)), materialized_(materialized) {
}

std::vector<db::model::HeaderRecord> HeaderTable::Rows(const std::optional<std::string>& mid) {
  return Search(HeaderSearch{.mid = mid});
}

std::vector<db::model::HeaderRecord> HeaderTable::Search(const HeaderSearch& search) {
  db::HeaderQuery query;
  query.mid       = search.mid;
  query.direction = search.direction;

  if (!search.pattern.empty()) {
    if (search.mode == HeaderMatch::kRegex) {
      RE2 compiled(search.pattern, RE2::Quiet);
      if (!compiled.ok()) {
        throw util::InvalidArgument("invalid regex '" + search.pattern + "': " + compiled.error());
      }
      query.kv_regex = search.pattern;
    } else {
      query.kv_contains = search.pattern;
    }
  }

  auto tx   = repository_->Begin(db::TxMode::kRead);
  auto rows = materialized_ ? repository_->ListHeaders(*tx, query) : Computed(*tx, query);
  tx->Commit();
  return rows;
}

std::vector<db::model::HeaderRecord> HeaderTable::Computed(db::Transaction& tx, const db::HeaderQuery& query) {
  std::unique_ptr<RE2> re;
  if (query.kv_regex) {
    re = std::make_unique<RE2>(*query.kv_regex, RE2::Quiet);
  }

  std::vector<db::model::ChunkRecord> flows;
  if (query.mid) {
    for (auto& chunk : repository_->ListChunksByMid(tx, *query.mid)) {
      if (chunk.kind == codec::kHttpFlow) flows.push_back(std::move(chunk));
    }
  } else {
    flows = repository_->ListChunksByKind(tx, codec::kHttpFlow);
  }

  std::vector<db::model::HeaderRecord> out;
  for (const auto& chunk : flows) {
    std::vector<db::model::HeaderRecord> rows;
    try {
      rows = codec::HeaderRows(chunk);
    } catch (const util::MalformedPayload& e) {
      FLOWSTORE_LOG_WARN("header rows skipped for malformed payload",
                         {observability::UintField("chunk_id", chunk.id), observability::StringField("error", e.what())});
      continue;
    }

    for (auto& h : rows) {
      if (query.direction && h.direction != *query.direction) continue;
      if (query.kv_contains && !ContainsNoCase(h.kv, *query.kv_contains)) continue;
      if (re && !RE2::PartialMatch(h.kv, *re)) continue;
      out.push_back(std::move(h));
    }
  }
  return out;
}

} // namespace flowstore::projection
