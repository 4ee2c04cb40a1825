#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/codec/flow_payload.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/projection/flow_row.hpp"

namespace flowstore::projection {

enum class FlowOrder {
  kInsertion,
  kCreated,
  kMethod,
  kHost,
  kSize,
  kStatus,
  kDuration,
};

struct FlowQuery {
  // flow filter expression; empty matches everything
  std::string filter;
  FlowOrder   order      = FlowOrder::kInsertion;
  bool        descending = false;
  std::size_t limit      = 0; // 0 = unlimited
  std::size_t offset     = 0;
};

struct FlowPage {
  std::vector<FlowRow> rows;
  // rows matching the filter before paging
  uint64_t total = 0;
};

/*
  Flow table: one row per http_flow chunk, computed from the current
  chunk state on every call. Nothing is cached.

  A payload that does not decode yields a row with only chunk_id, mid and
  size set; the query itself never fails because of one bad chunk.

  Ordering: null values sort first ascending and last descending, ties
  keep insertion order.
*/
class FlowTable {
 public:
  explicit FlowTable(std::shared_ptr<db::Repository> repository);

  // all rows in insertion order
  std::vector<FlowRow> Rows();

  // Throws util::InvalidArgument for a bad filter expression.
  FlowPage List(const FlowQuery& query);

  static FlowRow BuildRow(const db::model::ChunkRecord& chunk, const codec::HttpFlowPayload* payload,
                          const std::optional<db::ContentSize>& content);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace flowstore::projection
