#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/sequencer.hpp"
#include "internal/core/uniqueness_guard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/model/chunk_record.hpp"

namespace flowstore::core {

struct NewChunk {
  std::string mid;
  std::string kind;
  std::string payload;
};

struct ChunkStoreOptions {
  // kinds allowed to repeat per mid
  std::vector<std::string> multi_valued_kinds;
  // persist header rows with every http_flow write
  bool materialize_headers = true;
};

struct ReplaceResult {
  db::model::ChunkRecord  chunk;
  std::optional<uint64_t> replaced_id;
};

/*
  Write path and point reads of the chunk store.

  CRITICAL GUARANTEES:

  - Each write runs in one kWrite transaction: uniqueness check, seq
    assignment, insert, derived method and header rows commit together or
    not at all
  - Writes are serialized in-process; the repository transaction
    serializes them across connections
  - method is recomputed from (kind, payload) on every payload write
  - Reads use kRead transactions and see committed state only

  Errors: util::InvalidArgument, util::DuplicateChunk, util::NotFound,
  util::StorageError, util::InvariantViolation.
*/
class ChunkStore {
 public:
  ChunkStore(std::shared_ptr<db::Repository> repository, ChunkStoreOptions options = {});

  db::model::ChunkRecord Insert(const std::string& mid, const std::string& kind, const std::string& payload);

  // All or nothing.
  std::vector<db::model::ChunkRecord> InsertBatch(const std::vector<NewChunk>& chunks);

  // Insert-or-replace: an existing chunk of a non-exempt (mid, kind) is
  // deleted and the new one gets a fresh id and the next seq.
  ReplaceResult Replace(const std::string& mid, const std::string& kind, const std::string& payload);

  // Keeps id, mid, kind and seq.
  db::model::ChunkRecord UpdatePayload(uint64_t id, const std::string& payload);

  std::optional<db::model::ChunkRecord> GetById(uint64_t id);
  std::vector<db::model::ChunkRecord>   ListByMid(const std::string& mid);
  std::vector<db::model::ChunkRecord>   ListByKind(const std::string& kind, const db::Page& page = {});

  void     Delete(uint64_t id);
  uint64_t DeleteMessage(const std::string& mid);

  // Recomputes every persisted header row from chunk payloads. Returns the
  // number of http_flow chunks processed.
  uint64_t RebuildHeaders();

  bool MaterializesHeaders() const {
    return options_.materialize_headers;
  }

  const UniquenessGuard& Guard() const {
    return guard_;
  }

  const std::shared_ptr<db::Repository>& Repository() const {
    return repository_;
  }

 private:
  db::model::ChunkRecord InsertInTx(db::Transaction& tx, const NewChunk& chunk);
  void                   WriteHeaders(db::Transaction& tx, const db::model::ChunkRecord& chunk);

  std::shared_ptr<db::Repository> repository_;
  ChunkStoreOptions               options_;
  UniquenessGuard                 guard_;
  Sequencer                       sequencer_;

  std::mutex write_mutex_;
};

} // namespace flowstore::core
