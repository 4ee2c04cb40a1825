#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/chunk_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/projection/header_table.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstore::core::ChunkStore;
using flowstore::core::ChunkStoreOptions;
using flowstore::db::memory::MemoryRepository;
using flowstore::db::model::HeaderDirection;
using flowstore::projection::HeaderMatch;
using flowstore::projection::HeaderSearch;
using flowstore::projection::HeaderTable;

const char* kFlowA = R"({"request": {"method": "GET", "headers": [["Host", "a.example"], ["Cookie", "session=XYZ"]]},
                         "response": {"status_code": 200, "headers": [["Set-Cookie", "id=1; HttpOnly"], ["Server", "nginx"]]}})";
const char* kFlowB = R"({"request": {"method": "POST", "headers": [["Host", "b.example"], ["Content-Type", "application/json"]]}})";

struct Fixture {
  explicit Fixture(bool materialized)
      : repository(std::make_shared<MemoryRepository>()),
        store(repository, ChunkStoreOptions{.materialize_headers = materialized}),
        table(repository, materialized) {
  }

  std::shared_ptr<MemoryRepository> repository;
  ChunkStore                        store;
  HeaderTable                       table;
};

void TestRowsInTableOrder(bool materialized) {
  Fixture f(materialized);
  auto    a = f.store.Insert("ma", "http_flow", kFlowA);
  auto    b = f.store.Insert("mb", "http_flow", kFlowB);
  f.store.Insert("ma", "request_content", "Host=ignored");

  auto rows = f.table.Rows();
  assert(rows.size() == 6);
  assert(rows[0].chunk_id == a.id && rows[0].direction == HeaderDirection::kRequest && rows[0].position == 0);
  assert(rows[0].kv == "Host=a.example");
  assert(rows[1].key == "Cookie" && rows[1].value == "session=XYZ");
  assert(rows[2].direction == HeaderDirection::kResponse && rows[2].position == 0 && rows[2].kv == "Set-Cookie=id=1; HttpOnly");
  assert(rows[4].chunk_id == b.id && rows[4].mid == "mb");

  auto only_b = f.table.Rows(std::string("mb"));
  assert(only_b.size() == 2);
}

void TestSubstringSearchIsCaseInsensitive(bool materialized) {
  Fixture f(materialized);
  f.store.Insert("ma", "http_flow", kFlowA);
  f.store.Insert("mb", "http_flow", kFlowB);

  auto hosts = f.table.Search(HeaderSearch{.pattern = "host=B."});
  assert(hosts.size() == 1);
  assert(hosts[0].mid == "mb");

  // no wildcards: % and _ are literal
  assert(f.table.Search(HeaderSearch{.pattern = "host=%"}).empty());
  assert(f.table.Search(HeaderSearch{.pattern = "Set_Cookie"}).empty());

  auto cookies = f.table.Search(HeaderSearch{.pattern = "cookie", .direction = HeaderDirection::kResponse});
  assert(cookies.size() == 1);
  assert(cookies[0].key == "Set-Cookie");
}

void TestRegexSearch(bool materialized) {
  Fixture f(materialized);
  f.store.Insert("ma", "http_flow", kFlowA);
  f.store.Insert("mb", "http_flow", kFlowB);

  auto hosts = f.table.Search(HeaderSearch{.pattern = "^Host=[ab]\\.", .mode = HeaderMatch::kRegex});
  assert(hosts.size() == 2);

  auto session = f.table.Search(HeaderSearch{.pattern = "session=[A-Z]{3}$", .mode = HeaderMatch::kRegex, .mid = std::string("ma")});
  assert(session.size() == 1);
  assert(session[0].key == "Cookie");

  assert(f.table.Search(HeaderSearch{.pattern = "^host=", .mode = HeaderMatch::kRegex}).empty());

  bool threw = false;
  try {
    (void)f.table.Search(HeaderSearch{.pattern = "([", .mode = HeaderMatch::kRegex});
  } catch (const flowstore::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

std::string FlowWithCookie(const std::string& cookie) {
  return R"({"request": {"method": "GET", "headers": [["Host", "big.example"], ["Cookie", ")" + cookie + R"("]]}})";
}

void TestRegexOverLargeHeaderValue(bool materialized) {
  Fixture f(materialized);
  f.store.Insert("big", "http_flow", FlowWithCookie(std::string(64 * 1024, 'a')));

  auto rows = f.table.Search(HeaderSearch{.pattern = "Cookie=(a|b)*$", .mode = HeaderMatch::kRegex});
  assert(rows.size() == 1);
  assert(rows[0].value.size() == 64 * 1024);

  assert(f.table.Search(HeaderSearch{.pattern = "Cookie=(a|b)*c$", .mode = HeaderMatch::kRegex}).empty());
}

void TestRowsFollowPayloadChanges(bool materialized) {
  Fixture f(materialized);
  auto    a = f.store.Insert("ma", "http_flow", kFlowA);

  f.store.UpdatePayload(a.id, kFlowB);
  auto rows = f.table.Rows();
  assert(rows.size() == 2);
  assert(rows[1].kv == "Content-Type=application/json");

  f.store.DeleteMessage("ma");
  assert(f.table.Rows().empty());
}

void TestMalformedFlowHasNoRows(bool materialized) {
  Fixture f(materialized);
  f.store.Insert("bad", "http_flow", "[not an object");
  f.store.Insert("ma", "http_flow", kFlowA);
  assert(f.table.Rows().size() == 4);
}

void RunAll(bool materialized) {
  TestRowsInTableOrder(materialized);
  TestSubstringSearchIsCaseInsensitive(materialized);
  TestRegexSearch(materialized);
  TestRegexOverLargeHeaderValue(materialized);
  TestRowsFollowPayloadChanges(materialized);
  TestMalformedFlowHasNoRows(materialized);
}

} // namespace

int main() {
  RunAll(true);
  RunAll(false);

  std::cout << "flowstore_unit_header_table: pass\n";
  return 0;
}
