#include "internal/projection/flow_table.hpp"

#include <algorithm>

#include "internal/codec/kinds.hpp"
#include "internal/filter/flow_filter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::projection {

namespace {

struct Candidate {
  FlowRow                                row;
  std::optional<codec::HttpFlowPayload> payload;
};

// nullopt < any value
template <typename T>
int Compare(const std::optional<T>& a, const std::optional<T>& b) {
  if (!a && !b) return 0;
  if (!a) return -1;
  if (!b) return 1;
  if (*a < *b) return -1;
  if (*b < *a) return 1;
  return 0;
}

int CompareBy(FlowOrder order, const FlowRow& a, const FlowRow& b) {
  switch (order) {
    case FlowOrder::kCreated:
      return Compare(a.created_at, b.created_at);
    case FlowOrder::kMethod:
      return Compare(a.method, b.method);
    case FlowOrder::kHost:
      return Compare(a.host, b.host);
    case FlowOrder::kSize:
      return Compare(a.size, b.size);
    case FlowOrder::kStatus:
      return Compare(a.status_code, b.status_code);
    case FlowOrder::kDuration:
      return Compare(a.duration, b.duration);
    case FlowOrder::kInsertion:
      break;
  }
  return a.chunk_id < b.chunk_id ? -1 : (a.chunk_id > b.chunk_id ? 1 : 0);
}

std::vector<db::model::ChunkRecord> LoadFlows(db::Repository& repository, db::Transaction& tx, const filter::FlowFilter& filter) {
  auto method = filter.IndexableMethod();
  if (!method) {
    return repository.ListChunksByKind(tx, codec::kHttpFlow);
  }

  std::vector<db::model::ChunkRecord> flows;
  for (auto id : repository.FindFlowIdsByMethod(tx, *method)) {
    if (auto chunk = repository.GetChunk(tx, id)) {
      flows.push_back(std::move(*chunk));
    }
  }
  return flows;
}

} // namespace

FlowTable::FlowTable(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

FlowRow FlowTable::BuildRow(const db::model::ChunkRecord& chunk, const codec::HttpFlowPayload* payload,
                            const std::optional<db::ContentSize>& content) {
  FlowRow row;
  row.chunk_id = chunk.id;
  row.mid      = chunk.mid;
  if (content) {
    row.size = content->bytes;
  }
  if (!payload) {
    return row;
  }

  row.created_at = payload->timestamp_created;
  if (payload->request) {
    row.method = payload->request->method;
    row.host   = payload->request->host;
    row.path   = payload->request->path;
  }
  if (payload->response) {
    row.status_code = payload->response->status_code;
  }
  row.content_type = codec::ContentType(*payload);
  row.duration     = codec::Duration(*payload);
  return row;
}

std::vector<FlowRow> FlowTable::Rows() {
  return List(FlowQuery{}).rows;
}

FlowPage FlowTable::List(const FlowQuery& query) {
  const auto filter = filter::FlowFilter::Parse(query.filter);

  auto tx    = repository_->Begin(db::TxMode::kRead);
  auto flows = LoadFlows(*repository_, *tx, filter);
  auto sizes = repository_->ContentSizes(*tx, {codec::kRequestContent, codec::kResponseContent});
  tx->Commit();

  std::vector<Candidate> matched;
  matched.reserve(flows.size());
  for (const auto& chunk : flows) {
    Candidate c;
    try {
      c.payload = codec::DecodeHttpFlow(chunk.payload);
    } catch (const util::MalformedPayload& e) {
      FLOWSTORE_LOG_WARN("flow row rendered without payload fields",
                         {observability::UintField("chunk_id", chunk.id), observability::StringField("error", e.what())});
    }

    std::optional<db::ContentSize> content;
    if (auto it = sizes.find(chunk.mid); it != sizes.end()) {
      content = it->second;
    }

    const codec::HttpFlowPayload* payload = c.payload ? &*c.payload : nullptr;
    c.row = BuildRow(chunk, payload, content);
    if (filter.Matches(c.row, payload)) {
      matched.push_back(std::move(c));
    }
  }

  if (query.order != FlowOrder::kInsertion || query.descending) {
    std::stable_sort(matched.begin(), matched.end(), [&](const Candidate& a, const Candidate& b) {
      const int cmp = CompareBy(query.order, a.row, b.row);
      return query.descending ? cmp > 0 : cmp < 0;
    });
  }

  FlowPage page;
  page.total = matched.size();

  const std::size_t begin = std::min(query.offset, matched.size());
  std::size_t       end   = matched.size();
  if (query.limit != 0) {
    end = std::min(end, begin + query.limit);
  }
  page.rows.reserve(end - begin);
  for (std::size_t i = begin; i < end; ++i) {
    page.rows.push_back(std::move(matched[i].row));
  }
  return page;
}

} // namespace flowstore::projection
