#include "query_service.hpp"

#include "internal/projection/flow_table.hpp"
#include "internal/projection/header_table.hpp"
#include "internal/service/observe.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::service {

using namespace flowstore::services::v1;
namespace store_v1 = flowstore::store::v1;

namespace {

projection::FlowOrder FromProto(FlowOrder order) {
  switch (order) {
    case FLOW_ORDER_INSERTION:
      return projection::FlowOrder::kInsertion;
    case FLOW_ORDER_CREATED:
      return projection::FlowOrder::kCreated;
    case FLOW_ORDER_METHOD:
      return projection::FlowOrder::kMethod;
    case FLOW_ORDER_HOST:
      return projection::FlowOrder::kHost;
    case FLOW_ORDER_SIZE:
      return projection::FlowOrder::kSize;
    case FLOW_ORDER_STATUS:
      return projection::FlowOrder::kStatus;
    case FLOW_ORDER_DURATION:
      return projection::FlowOrder::kDuration;
    default:
      throw util::InvalidArgument("unknown flow order " + std::to_string(static_cast<int>(order)));
  }
}

void ToProto(const projection::FlowRow& row, store_v1::FlowRow* out) {
  out->set_chunk_id(row.chunk_id);
  out->set_mid(row.mid);
  if (row.created_at) out->set_created_at(*row.created_at);
  if (row.method) out->set_method(*row.method);
  if (row.host) out->set_host(*row.host);
  if (row.path) out->set_path(*row.path);
  if (row.status_code) out->set_status_code(*row.status_code);
  if (row.content_type) out->set_content_type(*row.content_type);
  if (row.duration) out->set_duration(*row.duration);
  if (row.size) out->set_size(*row.size);
}

store_v1::HeaderDirection ToProto(db::model::HeaderDirection direction) {
  return direction == db::model::HeaderDirection::kRequest ? store_v1::HEADER_DIRECTION_REQUEST : store_v1::HEADER_DIRECTION_RESPONSE;
}

void ToProto(const db::model::HeaderRecord& h, store_v1::HeaderRow* out) {
  out->set_chunk_id(h.chunk_id);
  out->set_mid(h.mid);
  out->set_direction(ToProto(h.direction));
  out->set_position(h.position);
  out->set_key(h.key);
  out->set_value(h.value);
  out->set_kv(h.kv);
}

} // namespace

QueryService::QueryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListFlowsResponse QueryService::ListFlows(const ListFlowsRequest& req) {
  return ObserveRpc("FlowQueryService.ListFlows", [&] {
    projection::FlowQuery query;
    query.filter     = req.filter();
    query.order      = FromProto(req.order());
    query.descending = req.descending();
    query.limit      = static_cast<std::size_t>(req.limit());
    query.offset     = static_cast<std::size_t>(req.offset());

    auto page = ctx_.flows->List(query);

    ListFlowsResponse resp;
    resp.set_total(page.total);
    for (const auto& row : page.rows) {
      ToProto(row, resp.add_flows());
    }
    return resp;
  });
}

SearchHeadersResponse QueryService::SearchHeaders(const SearchHeadersRequest& req) {
  return ObserveRpc("FlowQueryService.SearchHeaders", [&] {
    projection::HeaderSearch search;
    search.pattern = req.pattern();

    switch (req.mode()) {
      case HEADER_MATCH_SUBSTRING:
        search.mode = projection::HeaderMatch::kSubstring;
        break;
      case HEADER_MATCH_REGEX:
        search.mode = projection::HeaderMatch::kRegex;
        break;
      default:
        throw util::InvalidArgument("unknown header match mode " + std::to_string(static_cast<int>(req.mode())));
    }

    switch (req.direction()) {
      case store_v1::HEADER_DIRECTION_UNSPECIFIED:
        break;
      case store_v1::HEADER_DIRECTION_REQUEST:
        search.direction = db::model::HeaderDirection::kRequest;
        break;
      case store_v1::HEADER_DIRECTION_RESPONSE:
        search.direction = db::model::HeaderDirection::kResponse;
        break;
      default:
        throw util::InvalidArgument("unknown header direction " + std::to_string(static_cast<int>(req.direction())));
    }

    if (!req.mid().empty()) {
      search.mid = req.mid();
    }

    SearchHeadersResponse resp;
    for (const auto& h : ctx_.headers->Search(search)) {
      ToProto(h, resp.add_headers());
    }
    return resp;
  });
}

} // namespace flowstore::service
