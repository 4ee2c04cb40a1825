#include <cassert>
#include <iostream>
#include <string>

#include "flowstore/store/v1.hpp"
#include "internal/factory.hpp"
#include "internal/service/chunk_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace v1 = flowstore::store::v1;

flowstore::factory::Application BuildApp() {
  flowstore::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_chunk_store()->add_multi_valued_kinds("response_content_part");
  return flowstore::factory::Build(config);
}

std::string Flow(const std::string& method, int status) {
  return R"({"request": {"method": ")" + method + R"(", "host": "svc.example", "path": "/p", "headers": [["X-Trace", "t-)" + method +
         R"("]]}, "response": {"status_code": )" + std::to_string(status) + "}}";
}

v1::InsertChunksRequest InsertRequest(const std::string& mid, const std::string& kind, const std::string& payload) {
  v1::InsertChunksRequest req;
  auto*                   chunk = req.add_chunks();
  chunk->set_mid(mid);
  chunk->set_kind(kind);
  chunk->set_payload(payload);
  return req;
}

template <typename E, typename F>
void ExpectThrows(F&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

void TestInsertGetAndList() {
  auto app = BuildApp();

  auto inserted = app.chunk_service->InsertChunks(InsertRequest("m1", "http_flow", Flow("GET", 200)));
  assert(inserted.chunks_size() == 1);
  const auto& chunk = inserted.chunks(0);
  assert(chunk.id() != 0);
  assert(chunk.seq() == 1);
  assert(chunk.method() == "GET");

  v1::GetChunkRequest get;
  get.set_id(chunk.id());
  auto got = app.chunk_service->GetChunk(get);
  assert(got.chunk().payload() == Flow("GET", 200));

  v1::ListChunksRequest by_mid;
  by_mid.set_mid("m1");
  assert(app.chunk_service->ListChunks(by_mid).chunks_size() == 1);

  v1::ListChunksRequest by_kind;
  by_kind.set_kind("http_flow");
  by_kind.set_limit(10);
  assert(app.chunk_service->ListChunks(by_kind).chunks_size() == 1);
}

void TestRequestValidation() {
  auto app = BuildApp();

  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.chunk_service->InsertChunks(v1::InsertChunksRequest{}); });
  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.chunk_service->ReplaceChunk(v1::ReplaceChunkRequest{}); });
  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.chunk_service->GetChunk(v1::GetChunkRequest{}); });
  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.chunk_service->ListChunks(v1::ListChunksRequest{}); });
  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.chunk_service->DeleteMessage(v1::DeleteMessageRequest{}); });

  v1::GetChunkRequest missing;
  missing.set_id(12345);
  ExpectThrows<flowstore::util::NotFound>([&] { app.chunk_service->GetChunk(missing); });
}

void TestReplaceAndDelete() {
  auto app = BuildApp();
  auto old = app.chunk_service->InsertChunks(InsertRequest("m1", "http_flow", Flow("GET", 200))).chunks(0);

  v1::ReplaceChunkRequest replace;
  replace.mutable_chunk()->set_mid("m1");
  replace.mutable_chunk()->set_kind("http_flow");
  replace.mutable_chunk()->set_payload(Flow("PUT", 201));
  auto replaced = app.chunk_service->ReplaceChunk(replace);
  assert(replaced.has_replaced_id());
  assert(replaced.replaced_id() == old.id());
  assert(replaced.chunk().seq() == 2);

  v1::UpdatePayloadRequest update;
  update.set_id(replaced.chunk().id());
  update.set_payload(Flow("DELETE", 204));
  assert(app.chunk_service->UpdatePayload(update).chunk().method() == "DELETE");

  app.chunk_service->InsertChunks(InsertRequest("m1", "response_content_part", "a"));
  app.chunk_service->InsertChunks(InsertRequest("m1", "response_content_part", "b"));

  v1::DeleteChunkRequest del;
  del.set_id(replaced.chunk().id());
  app.chunk_service->DeleteChunk(del);
  ExpectThrows<flowstore::util::NotFound>([&] { app.chunk_service->DeleteChunk(del); });

  v1::DeleteMessageRequest del_mid;
  del_mid.set_mid("m1");
  assert(app.chunk_service->DeleteMessage(del_mid).deleted() == 2);
}

void TestListFlowsAndSearchHeaders() {
  auto app = BuildApp();
  app.chunk_service->InsertChunks(InsertRequest("m1", "http_flow", Flow("GET", 200)));
  app.chunk_service->InsertChunks(InsertRequest("m2", "http_flow", Flow("POST", 500)));

  v1::ListFlowsRequest list;
  list.set_filter("~c 500");
  auto flows = app.query_service->ListFlows(list);
  assert(flows.total() == 1);
  assert(flows.flows(0).mid() == "m2");
  assert(flows.flows(0).has_status_code() && flows.flows(0).status_code() == 500);
  assert(!flows.flows(0).has_duration());
  assert(!flows.flows(0).has_size());

  v1::ListFlowsRequest ordered;
  ordered.set_order(v1::FLOW_ORDER_STATUS);
  ordered.set_descending(true);
  ordered.set_limit(1);
  auto top = app.query_service->ListFlows(ordered);
  assert(top.total() == 2);
  assert(top.flows_size() == 1);
  assert(top.flows(0).mid() == "m2");

  v1::ListFlowsRequest bad_order;
  bad_order.set_order(static_cast<v1::FlowOrder>(99));
  ExpectThrows<flowstore::util::InvalidArgument>([&] { app.query_service->ListFlows(bad_order); });

  v1::SearchHeadersRequest search;
  search.set_pattern("x-trace=t-p");
  auto headers = app.query_service->SearchHeaders(search);
  assert(headers.headers_size() == 1);
  assert(headers.headers(0).mid() == "m2");
  assert(headers.headers(0).direction() == v1::HEADER_DIRECTION_REQUEST);
  assert(headers.headers(0).kv() == "X-Trace=t-POST");

  v1::SearchHeadersRequest regex;
  regex.set_pattern("^X-Trace=t-(GET|POST)$");
  regex.set_mode(v1::HEADER_MATCH_REGEX);
  regex.set_mid("m1");
  assert(app.query_service->SearchHeaders(regex).headers_size() == 1);

  v1::SearchHeadersRequest responses;
  responses.set_direction(v1::HEADER_DIRECTION_RESPONSE);
  assert(app.query_service->SearchHeaders(responses).headers_size() == 0);
}

} // namespace

int main() {
  TestInsertGetAndList();
  TestRequestValidation();
  TestReplaceAndDelete();
  TestListFlowsAndSearchHeaders();

  std::cout << "flowstore_unit_service: pass\n";
  return 0;
}
