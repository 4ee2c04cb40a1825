#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstore::db::ErrorCode;
using flowstore::db::HeaderQuery;
using flowstore::db::Page;
using flowstore::db::Repository;
using flowstore::db::TxMode;
using flowstore::db::memory::MemoryRepository;
using flowstore::db::model::ChunkRecord;
using flowstore::db::model::HeaderDirection;
using flowstore::db::model::HeaderRecord;

constexpr const char* kPartKind = "response_content_part";

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                        name;
  std::function<std::shared_ptr<Repository>()>       make_repository;
  std::function<bool()>                              supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                              cleanup;
  bool                                               supports_parallel_transactions = true;
};

ChunkRecord Insert(Repository& repo, flowstore::db::Transaction& tx, const std::string& mid, const std::string& kind,
                   const std::string& payload = "", const std::string& method = "") {
  ChunkRecord record{.mid = mid, .kind = kind, .payload = payload, .method = method};
  record.seq = repo.LastSeq(tx, mid) + 1;
  assert(repo.RecordSeq(tx, mid, record.seq));
  assert(repo.InsertChunk(tx, record));
  return record;
}

HeaderRecord Header(const ChunkRecord& chunk, HeaderDirection direction, uint32_t position, const std::string& key,
                    const std::string& value) {
  return HeaderRecord{.chunk_id  = chunk.id,
                      .mid       = chunk.mid,
                      .direction = direction,
                      .position  = position,
                      .key       = key,
                      .value     = value,
                      .kv        = key + "=" + value};
}

void VerifyChunkCrud(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "crud";
  auto       tx  = repo.Begin();

  auto a = Insert(repo, *tx, mid, "http_flow", std::string("{\"a\":1}\0bin", 11), "GET");
  auto b = Insert(repo, *tx, mid, "request_content", "body");
  assert(a.id != 0);
  assert(b.id > a.id);

  auto read = repo.GetChunk(*tx, a.id);
  assert(read.has_value());
  assert(read->mid == mid && read->kind == "http_flow" && read->seq == a.seq);
  assert(read->payload.size() == 11);
  assert(read->method == "GET");

  auto found = repo.FindChunk(*tx, mid, "request_content");
  assert(found && found->id == b.id);
  assert(!repo.FindChunk(*tx, mid, "response_content"));

  assert(repo.UpdateChunkPayload(*tx, b.id, "new body", ""));
  assert(repo.GetChunk(*tx, b.id)->payload == "new body");
  assert(repo.UpdateChunkPayload(*tx, 987654321, "x", "").code == ErrorCode::NotFound);

  auto by_mid = repo.ListChunksByMid(*tx, mid);
  assert(by_mid.size() == 2);
  assert(by_mid[0].id == a.id && by_mid[1].id == b.id);

  assert(repo.DeleteChunk(*tx, a.id));
  assert(!repo.GetChunk(*tx, a.id));
  assert(repo.DeleteChunk(*tx, a.id).code == ErrorCode::NotFound);

  uint64_t deleted = 0;
  assert(repo.DeleteChunksByMid(*tx, mid, &deleted));
  assert(deleted == 1);
  assert(repo.ListChunksByMid(*tx, mid).empty());

  tx->Commit();
}

void VerifyIdsAreNeverReused(Repository& repo, const std::string& prefix) {
  auto tx    = repo.Begin();
  auto first = Insert(repo, *tx, prefix + "ids", "client_conn");
  assert(repo.DeleteChunk(*tx, first.id));
  auto second = Insert(repo, *tx, prefix + "ids", "client_conn");
  assert(second.id > first.id);
  tx->Commit();
}

void VerifyRollbackDiscards(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "rollback";
  {
    auto tx = repo.Begin();
    Insert(repo, *tx, mid, "http_flow");
    tx->Rollback();
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    Insert(repo, *tx, mid, "http_flow");
  }

  auto tx = repo.Begin(TxMode::kRead);
  assert(repo.ListChunksByMid(*tx, mid).empty());
  assert(repo.LastSeq(*tx, mid) == 0);
  tx->Commit();
}

void VerifySeqHighWater(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "seq";
  auto       tx  = repo.Begin();
  auto       a   = Insert(repo, *tx, mid, "http_flow");
  auto       b   = Insert(repo, *tx, mid, "request_content");
  assert(a.seq == 1 && b.seq == 2);

  uint64_t deleted = 0;
  assert(repo.DeleteChunksByMid(*tx, mid, &deleted));
  assert(repo.LastSeq(*tx, mid) == 2);

  auto stale = repo.RecordSeq(*tx, mid, 2);
  assert(stale.code == ErrorCode::Conflict);

  auto c = Insert(repo, *tx, mid, "http_flow");
  assert(c.seq == 3);
  tx->Commit();
}

void VerifyUniqueIndex(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "unique";
  auto       tx  = repo.Begin();
  Insert(repo, *tx, mid, "http_flow");

  ChunkRecord dup{.mid = mid, .kind = "http_flow", .seq = repo.LastSeq(*tx, mid) + 1};
  assert(repo.InsertChunk(*tx, dup).code == ErrorCode::ConstraintViolation);

  Insert(repo, *tx, mid, kPartKind, "a");
  Insert(repo, *tx, mid, kPartKind, "b");
  assert(repo.ListChunksByMid(*tx, mid).size() == 3);
  tx->Commit();
}

void VerifyListByKindPaging(Repository& repo, const std::string& prefix) {
  const auto kind = prefix + "paged_kind";
  auto       tx   = repo.Begin();
  std::vector<uint64_t> ids;
  for (int i = 0; i < 5; ++i) {
    ids.push_back(Insert(repo, *tx, prefix + "page" + std::to_string(i), kind).id);
  }
  tx->Commit();

  auto read = repo.Begin(TxMode::kRead);
  auto all  = repo.ListChunksByKind(*read, kind);
  assert(all.size() == 5);
  auto page = repo.ListChunksByKind(*read, kind, Page{.limit = 2, .offset = 1});
  assert(page.size() == 2);
  assert(page[0].id == ids[1] && page[1].id == ids[2]);
  auto tail = repo.ListChunksByKind(*read, kind, Page{.offset = 4});
  assert(tail.size() == 1 && tail[0].id == ids[4]);
  read->Commit();
}

void VerifyMethodIndex(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();
  auto a  = Insert(repo, *tx, prefix + "method_a", "http_flow", "{}", "GET");
  auto b  = Insert(repo, *tx, prefix + "method_b", "http_flow", "{}", "get");
  Insert(repo, *tx, prefix + "method_c", "http_flow", "{}", "POST");
  Insert(repo, *tx, prefix + "method_d", "client_conn", "{}", "GET");
  tx->Commit();

  auto read = repo.Begin(TxMode::kRead);
  auto ids  = repo.FindFlowIdsByMethod(*read, "Get");
  assert(std::find(ids.begin(), ids.end(), a.id) != ids.end());
  assert(std::find(ids.begin(), ids.end(), b.id) != ids.end());
  assert(std::is_sorted(ids.begin(), ids.end()));
  for (auto id : ids) {
    auto chunk = repo.GetChunk(*read, id);
    assert(chunk && chunk->kind == "http_flow");
  }
  read->Commit();
}

void VerifyContentSizes(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "sizes";
  auto       tx  = repo.Begin();
  Insert(repo, *tx, mid, "request_content", "1234");
  Insert(repo, *tx, mid, "response_content", "123456");
  Insert(repo, *tx, mid, "client_conn", "ignored");
  Insert(repo, *tx, prefix + "sizes_none", "http_flow", "{}");
  tx->Commit();

  auto read  = repo.Begin(TxMode::kRead);
  auto sizes = repo.ContentSizes(*read, {"request_content", "response_content"});
  assert(sizes.contains(mid));
  assert(sizes[mid].bytes == 10);
  assert(sizes[mid].chunks == 2);
  assert(!sizes.contains(prefix + "sizes_none"));
  read->Commit();
}

void VerifyHeaders(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "headers";
  auto       tx  = repo.Begin();
  auto       a   = Insert(repo, *tx, mid, "http_flow");
  auto       b   = Insert(repo, *tx, prefix + "headers_other", "http_flow");

  assert(repo.ReplaceHeaders(*tx, a.id,
                             {Header(a, HeaderDirection::kResponse, 0, "Content-Type", "text/html"),
                              Header(a, HeaderDirection::kRequest, 1, "Accept", "100%_sure"),
                              Header(a, HeaderDirection::kRequest, 0, "Host", "A.example")}));
  assert(repo.ReplaceHeaders(*tx, b.id, {Header(b, HeaderDirection::kRequest, 0, "Host", "b.example")}));

  auto dup = repo.ReplaceHeaders(*tx, b.id,
                                 {Header(b, HeaderDirection::kRequest, 0, "X", "1"), Header(b, HeaderDirection::kRequest, 0, "Y", "2")});
  assert(!dup);
  tx->Commit();

  auto read = repo.Begin(TxMode::kRead);

  auto rows = repo.ListHeaders(*read, HeaderQuery{.mid = mid});
  assert(rows.size() == 3);
  assert(rows[0].key == "Host" && rows[0].position == 0);
  assert(rows[1].key == "Accept");
  assert(rows[2].direction == HeaderDirection::kResponse);

  auto requests = repo.ListHeaders(*read, HeaderQuery{.mid = mid, .direction = HeaderDirection::kRequest});
  assert(requests.size() == 2);

  auto hosts = repo.ListHeaders(*read, HeaderQuery{.kv_contains = std::string("host=a.EX")});
  assert(hosts.size() == 1 && hosts[0].chunk_id == a.id);

  // LIKE wildcards are literal
  assert(repo.ListHeaders(*read, HeaderQuery{.mid = mid, .kv_contains = std::string("100%_")}).size() == 1);
  assert(repo.ListHeaders(*read, HeaderQuery{.mid = mid, .kv_contains = std::string("1%0")}).empty());

  auto regex = repo.ListHeaders(*read, HeaderQuery{.kv_regex = std::string("^Host=[ab]\\.example$")});
  assert(regex.size() == 1);
  assert(repo.ListHeaders(*read, HeaderQuery{.kv_regex = std::string("^Host=[Aa]\\.")}).size() == 1);
  read->Commit();

  // rows go with their chunk
  auto del = repo.Begin();
  assert(repo.DeleteChunk(*del, a.id));
  uint64_t deleted = 0;
  assert(repo.DeleteChunksByMid(*del, prefix + "headers_other", &deleted));
  assert(repo.ListHeaders(*del, HeaderQuery{.mid = mid}).empty());
  assert(repo.ListHeaders(*del, HeaderQuery{.mid = prefix + "headers_other"}).empty());
  del->Commit();
}

void VerifyReadersSeeCommittedStateOnly(Repository& repo, const std::string& prefix) {
  const auto mid = prefix + "isolation";

  auto writer = repo.Begin();
  Insert(repo, *writer, mid, "http_flow");

  {
    auto reader = repo.Begin(TxMode::kRead);
    assert(repo.ListChunksByMid(*reader, mid).empty());
    reader->Commit();
  }

  writer->Commit();

  auto reader = repo.Begin(TxMode::kRead);
  assert(repo.ListChunksByMid(*reader, mid).size() == 1);
  reader->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, std::shared_ptr<Repository>& repo, const std::string& prefix) {
  const auto mid = prefix + "durable";
  uint64_t   id  = 0;
  {
    auto tx = repo->Begin();
    auto a  = Insert(*repo, *tx, mid, "http_flow", "{\"request\":{}}", "PUT");
    id      = a.id;
    assert(repo->ReplaceHeaders(*tx, a.id, {Header(a, HeaderDirection::kRequest, 0, "K", "V")}));
    Insert(*repo, *tx, mid, "request_content", "x");
    tx->Commit();

    auto del = repo->Begin();
    auto rc  = repo->FindChunk(*del, mid, "request_content");
    assert(rc && repo->DeleteChunk(*del, rc->id));
    del->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto chunk = repo->GetChunk(*tx, id);
  assert(chunk.has_value());
  assert(chunk->method == "PUT");
  assert(repo->ListHeaders(*tx, HeaderQuery{.mid = mid}).size() == 1);
  assert(repo->LastSeq(*tx, mid) == 2);
  auto next = Insert(*repo, *tx, mid, "response_content");
  assert(next.seq == 3);
  tx->Commit();
}

void RunBackendSuite(BackendFactory& backend) {
  auto       repo   = backend.make_repository();
  const auto prefix = backend.name + "_" + std::to_string(NowMs()) + "_";

  VerifyChunkCrud(*repo, prefix);
  VerifyIdsAreNeverReused(*repo, prefix);
  VerifyRollbackDiscards(*repo, prefix);
  VerifySeqHighWater(*repo, prefix);
  VerifyUniqueIndex(*repo, prefix);
  VerifyListByKindPaging(*repo, prefix);
  VerifyMethodIndex(*repo, prefix);
  VerifyContentSizes(*repo, prefix);
  VerifyHeaders(*repo, prefix);

  if (backend.supports_parallel_transactions) {
    VerifyReadersSeeCommittedStateOnly(*repo, prefix);
  }

  if (backend.supports_restart()) {
    VerifyRestartDurability(backend, repo, prefix);
  }

  repo.reset();
  backend.cleanup();
  std::cout << "  backend " << backend.name << ": ok\n";
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(std::vector<std::string>{kPartKind}); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flowstore_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<flowstore::db::sqlite::SqliteDB>(db_path);
    flowstore::db::sqlite::BootstrapSchema(*db, flowstore::db::sqlite::SchemaOptions{.multi_valued_kinds = {kPartKind}});
    auto readers = std::make_shared<flowstore::db::sqlite::SqliteReaderPool>(db_path, 2);
    return std::make_shared<flowstore::db::sqlite::SqliteRepository>(std::move(db), std::move(readers));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flowstore_integration_repository_parity: pass\n";
  return 0;
}
