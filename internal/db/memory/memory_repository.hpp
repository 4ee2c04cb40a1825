#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowstore::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Committed state is an immutable snapshot. Read transactions share it,
  write transactions work on a private copy and publish it on commit
  (optimistic: commit fails if another writer published first).

  The snapshot is split into shared nodes: chunks live in fixed-size pages
  indexed by id, per-mid entries live in hash shards. Copying a snapshot
  copies node pointers only; a write copies just the nodes it touches, and
  chunk bodies are never copied.

  Mirrors the sqlite unique index: (mid, kind) is unique for every kind
  not listed in multi_valued_kinds.
*/
class MemoryRepository final : public db::Repository {
public:
  explicit MemoryRepository(std::vector<std::string> multi_valued_kinds = {});

  using Repository::Begin;
  using Repository::ListChunksByKind;

  std::unique_ptr<Transaction> Begin(TxMode mode) override;

  uint64_t LastSeq(Transaction&, const std::string& mid) override;
  Result RecordSeq(Transaction&, const std::string& mid, uint64_t seq) override;

  Result InsertChunk(Transaction&, model::ChunkRecord&) override;
  std::optional<model::ChunkRecord> GetChunk(Transaction&, uint64_t id) override;
  std::optional<model::ChunkRecord> FindChunk(Transaction&, const std::string& mid, const std::string& kind) override;
  std::vector<model::ChunkRecord> ListChunksByMid(Transaction&, const std::string& mid) override;
  std::vector<model::ChunkRecord> ListChunksByKind(Transaction&, const std::string& kind, const Page& page) override;
  Result UpdateChunkPayload(Transaction&, uint64_t id, const std::string& payload, const std::string& method) override;
  Result DeleteChunk(Transaction&, uint64_t id) override;
  Result DeleteChunksByMid(Transaction&, const std::string& mid, uint64_t* deleted) override;
  uint64_t CountChunks(Transaction&) override;

  std::vector<uint64_t> FindFlowIdsByMethod(Transaction&, const std::string& method) override;
  std::unordered_map<std::string, ContentSize> ContentSizes(Transaction&, const std::vector<std::string>& kinds) override;

  Result ReplaceHeaders(Transaction&, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows) override;
  std::vector<model::HeaderRecord> ListHeaders(Transaction&, const HeaderQuery& query) override;

private:
  friend class MemoryTransaction;

  static constexpr std::size_t kPageSize  = 256;
  static constexpr std::size_t kMidShards = 1024;

  // A node is changed in place only by the write transaction that created
  // it (same generation). Every other writer copies it first.
  template <typename T>
  struct Node {
    uint64_t generation = 0;
    T        value;
  };

  struct ChunkSlot {
    std::shared_ptr<const model::ChunkRecord>              chunk;
    std::shared_ptr<const std::vector<model::HeaderRecord>> headers; // sorted by (direction, position)
  };

  struct MidEntry {
    uint64_t              seq_mark = 0;
    std::vector<uint64_t> ids; // ascending
  };

  using ChunkPage = std::array<ChunkSlot, kPageSize>;
  using MidShard  = std::unordered_map<std::string, MidEntry>;

  struct State {
    // page i holds ids [i * kPageSize + 1, (i + 1) * kPageSize]
    std::vector<std::shared_ptr<Node<ChunkPage>>>        pages;
    std::array<std::shared_ptr<Node<MidShard>>, kMidShards> mids;
    uint64_t next_id     = 1;
    uint64_t chunk_count = 0;
    uint64_t generation  = 0;
  };

  template <typename T>
  static T& Own(std::shared_ptr<Node<T>>& node, uint64_t generation);

  static const ChunkSlot* FindSlot(const State& s, uint64_t id);
  static ChunkSlot*       MutableSlot(State& s, uint64_t id);
  static const MidEntry*  FindMid(const State& s, const std::string& mid);
  static MidEntry&        MutableMid(State& s, const std::string& mid);

  template <typename Fn>
  static void ForEachChunk(const State& s, Fn&& fn);

  std::set<std::string> multi_valued_kinds_;

  std::mutex                   mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t                     committed_version_ = 0;
  uint64_t                     generations_       = 0;
};

}
