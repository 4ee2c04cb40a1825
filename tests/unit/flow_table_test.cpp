#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/projection/flow_table.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstore::core::ChunkStore;
using flowstore::db::memory::MemoryRepository;
using flowstore::projection::FlowOrder;
using flowstore::projection::FlowQuery;
using flowstore::projection::FlowTable;

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  ChunkStore                        store{repository};
  FlowTable                         table{repository};
};

std::string Flow(const std::string& method, const std::string& host, int status, double created) {
  return R"({"timestamp_created": )" + std::to_string(created) + R"(, "request": {"method": ")" + method + R"(", "host": ")" + host +
         R"(", "path": "/"}, "response": {"status_code": )" + std::to_string(status) + "}}";
}

std::vector<uint64_t> Ids(const std::vector<flowstore::projection::FlowRow>& rows) {
  std::vector<uint64_t> ids;
  for (const auto& r : rows) ids.push_back(r.chunk_id);
  return ids;
}

void TestRowFieldsFromPayloadAndContent() {
  Fixture f;
  auto    flow = f.store.Insert("m1", "http_flow", R"({
    "timestamp_created": 5.5,
    "request": {"method": "POST", "host": "h.example", "path": "/upload"},
    "response": {"status_code": 201, "headers": [["content-type", "text/plain;charset=ascii"]], "timestamp_start": 2.0, "timestamp_end": 2.25}
  })");
  f.store.Insert("m1", "request_content", "12345");
  f.store.Insert("m1", "response_content", "abc");
  f.store.Insert("m1", "client_conn", "ignored for size");

  auto rows = f.table.Rows();
  assert(rows.size() == 1);
  const auto& row = rows[0];
  assert(row.chunk_id == flow.id);
  assert(row.mid == "m1");
  assert(row.created_at == std::optional<double>(5.5));
  assert(row.method == std::optional<std::string>("POST"));
  assert(row.host == std::optional<std::string>("h.example"));
  assert(row.path == std::optional<std::string>("/upload"));
  assert(row.status_code == std::optional<int64_t>(201));
  assert(row.content_type == std::optional<std::string>("text/plain"));
  assert(row.duration == std::optional<double>(0.25));
  assert(row.size == std::optional<uint64_t>(8));
}

void TestMissingPiecesAreNull() {
  Fixture f;
  f.store.Insert("m1", "http_flow", R"({"request": {"method": "GET"}})");
  f.store.Insert("m2", "http_flow", "<<binary>>");
  f.store.Insert("m2", "response_content", "xyz");

  auto rows = f.table.Rows();
  assert(rows.size() == 2);
  assert(rows[0].method == std::optional<std::string>("GET"));
  assert(!rows[0].status_code && !rows[0].content_type && !rows[0].duration && !rows[0].size);

  // malformed payload still yields a row
  assert(rows[1].mid == "m2");
  assert(!rows[1].method && !rows[1].host);
  assert(rows[1].size == std::optional<uint64_t>(3));
}

void TestRowsFollowChunkChanges() {
  Fixture f;
  auto    chunk = f.store.Insert("m1", "http_flow", Flow("GET", "a", 200, 1));
  assert(f.table.Rows()[0].status_code == std::optional<int64_t>(200));

  f.store.UpdatePayload(chunk.id, Flow("GET", "a", 500, 1));
  assert(f.table.Rows()[0].status_code == std::optional<int64_t>(500));

  f.store.Delete(chunk.id);
  assert(f.table.Rows().empty());
}

void TestFilterAndMethodIndex() {
  Fixture f;
  auto    a = f.store.Insert("m1", "http_flow", Flow("GET", "a.example", 200, 3));
  auto    b = f.store.Insert("m2", "http_flow", Flow("POST", "b.example", 500, 1));
  auto    c = f.store.Insert("m3", "http_flow", Flow("get", "c.example", 404, 2));

  auto gets = f.table.List(FlowQuery{.filter = "~m GET"});
  assert(gets.total == 2);
  assert((Ids(gets.rows) == std::vector<uint64_t>{a.id, c.id}));

  auto narrowed = f.table.List(FlowQuery{.filter = "~m GET & ~c 404"});
  assert((Ids(narrowed.rows) == std::vector<uint64_t>{c.id}));

  auto either = f.table.List(FlowQuery{.filter = "~m POST | ~d ^a"});
  assert((Ids(either.rows) == std::vector<uint64_t>{a.id, b.id}));

  bool threw = false;
  try {
    (void)f.table.List(FlowQuery{.filter = "~c"});
  } catch (const flowstore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestOrderingPutsNullsFirst() {
  Fixture f;
  auto    a = f.store.Insert("m1", "http_flow", Flow("GET", "b", 200, 3));
  auto    b = f.store.Insert("m2", "http_flow", R"({"request": {"method": "GET"}})");
  auto    c = f.store.Insert("m3", "http_flow", Flow("GET", "a", 404, 1));
  auto    d = f.store.Insert("m4", "http_flow", Flow("GET", "a", 200, 2));

  auto by_status = f.table.List(FlowQuery{.order = FlowOrder::kStatus});
  assert((Ids(by_status.rows) == std::vector<uint64_t>{b.id, a.id, d.id, c.id}));

  auto by_status_desc = f.table.List(FlowQuery{.order = FlowOrder::kStatus, .descending = true});
  assert((Ids(by_status_desc.rows) == std::vector<uint64_t>{c.id, a.id, d.id, b.id}));

  auto by_host = f.table.List(FlowQuery{.order = FlowOrder::kHost});
  assert((Ids(by_host.rows) == std::vector<uint64_t>{b.id, c.id, d.id, a.id}));

  auto by_created = f.table.List(FlowQuery{.order = FlowOrder::kCreated});
  assert((Ids(by_created.rows) == std::vector<uint64_t>{b.id, c.id, d.id, a.id}));

  auto newest_first = f.table.List(FlowQuery{.descending = true});
  assert((Ids(newest_first.rows) == std::vector<uint64_t>{d.id, c.id, b.id, a.id}));
}

void TestPaging() {
  Fixture               f;
  std::vector<uint64_t> ids;
  for (int i = 0; i < 7; ++i) {
    ids.push_back(f.store.Insert("m" + std::to_string(i), "http_flow", Flow("GET", "h", 200, i)).id);
  }

  auto page = f.table.List(FlowQuery{.limit = 3, .offset = 2});
  assert(page.total == 7);
  assert((Ids(page.rows) == std::vector<uint64_t>{ids[2], ids[3], ids[4]}));

  auto tail = f.table.List(FlowQuery{.limit = 10, .offset = 5});
  assert(tail.rows.size() == 2);

  auto past = f.table.List(FlowQuery{.offset = 100});
  assert(past.total == 7);
  assert(past.rows.empty());
}

} // namespace

int main() {
  TestRowFieldsFromPayloadAndContent();
  TestMissingPiecesAreNull();
  TestRowsFollowChunkChanges();
  TestFilterAndMethodIndex();
  TestOrderingPutsNullsFirst();
  TestPaging();

  std::cout << "flowstore_unit_flow_table: pass\n";
  return 0;
}
