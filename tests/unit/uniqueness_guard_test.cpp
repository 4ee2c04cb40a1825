#include <cassert>
#include <iostream>
#include <string>

#include "internal/core/uniqueness_guard.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowstore::core::UniquenessGuard;
using flowstore::db::TxMode;
using flowstore::db::memory::MemoryRepository;
using flowstore::db::model::ChunkRecord;

void Seed(MemoryRepository& repo, const std::string& mid, const std::string& kind) {
  auto        tx = repo.Begin(TxMode::kWrite);
  ChunkRecord record{.mid = mid, .kind = kind, .seq = repo.LastSeq(*tx, mid) + 1};
  assert(repo.RecordSeq(*tx, mid, record.seq));
  assert(repo.InsertChunk(*tx, record));
  tx->Commit();
}

void TestFreshKeyPasses() {
  MemoryRepository repo;
  UniquenessGuard  guard;

  auto tx = repo.Begin(TxMode::kRead);
  guard.Check(repo, *tx, "m1", "http_flow");
}

void TestDuplicateKeyThrows() {
  MemoryRepository repo;
  UniquenessGuard  guard;
  Seed(repo, "m1", "http_flow");

  auto tx    = repo.Begin(TxMode::kRead);
  bool threw = false;
  try {
    guard.Check(repo, *tx, "m1", "http_flow");
  } catch (const flowstore::util::DuplicateChunk& e) {
    threw = true;
    assert(e.mid() == "m1");
    assert(e.kind() == "http_flow");
  }
  assert(threw);

  // other mid, other kind
  guard.Check(repo, *tx, "m2", "http_flow");
  guard.Check(repo, *tx, "m1", "client_conn");
}

void TestExemptKindMayRepeat() {
  MemoryRepository repo({"response_content_part"});
  UniquenessGuard  guard({"response_content_part"});
  Seed(repo, "m1", "response_content_part");

  assert(guard.IsExempt("response_content_part"));
  assert(!guard.IsExempt("http_flow"));
  assert(guard.ExemptKinds().size() == 1);

  auto tx = repo.Begin(TxMode::kRead);
  guard.Check(repo, *tx, "m1", "response_content_part");
}

void TestDuplicateIsAConstraintViolation() {
  MemoryRepository repo;
  UniquenessGuard  guard;
  Seed(repo, "m1", "server_conn");

  auto tx    = repo.Begin(TxMode::kRead);
  bool threw = false;
  try {
    guard.Check(repo, *tx, "m1", "server_conn");
  } catch (const flowstore::util::ConstraintViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestRepositoryIndexBacksTheGuard() {
  MemoryRepository repo;
  Seed(repo, "m1", "http_flow");

  auto        tx = repo.Begin(TxMode::kWrite);
  ChunkRecord dup{.mid = "m1", .kind = "http_flow", .seq = 2};
  auto        result = repo.InsertChunk(*tx, dup);
  assert(!result);
  assert(result.code == flowstore::db::ErrorCode::ConstraintViolation);
}

} // namespace

int main() {
  TestFreshKeyPasses();
  TestDuplicateKeyThrows();
  TestExemptKindMayRepeat();
  TestDuplicateIsAConstraintViolation();
  TestRepositoryIndexBacksTheGuard();

  std::cout << "flowstore_unit_uniqueness_guard: pass\n";
  return 0;
}
