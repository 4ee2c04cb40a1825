#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/chunk_record.hpp"
#include "internal/db/model/header_record.hpp"

namespace flowstore::db {

struct Page {
  std::size_t limit  = 0; // 0 = unlimited
  std::size_t offset = 0;
};

struct HeaderQuery {
  std::optional<std::string>            mid;
  std::optional<model::HeaderDirection> direction;
  // Substring of the key=value composite, ASCII case-insensitive like SQL
  // LIKE. No wildcards.
  std::optional<std::string> kv_contains;
  // RE2 pattern searched in the key=value composite. Must be valid.
  std::optional<std::string> kv_regex;
};

struct ContentSize {
  uint64_t bytes  = 0;
  uint64_t chunks = 0;
};

/*
  Repository abstraction over the chunk table and its derived tables.

  CRITICAL GUARANTEES:

  - All writes require a kWrite Transaction
  - Reads inside a transaction see its writes
  - Chunk ids are assigned on insert, strictly increasing, never reused
  - The per-mid sequence high-water mark only moves up

  The repository is payload agnostic. Derived values (method, header rows)
  are computed by the core and handed in.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(TxMode mode) = 0;

  std::unique_ptr<Transaction> Begin() {
    return Begin(TxMode::kWrite);
  }

  // ---------------------------------------------------------------------
  // Sequencing
  // ---------------------------------------------------------------------

  // Highest seq ever handed out for mid (0 if none).
  virtual uint64_t LastSeq(Transaction&, const std::string& mid) = 0;

  // Moves the high-water mark for mid to seq. Fails with Conflict unless
  // seq is above the current mark.
  virtual Result RecordSeq(Transaction&, const std::string& mid, uint64_t seq) = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertChunk(Transaction&, model::ChunkRecord& record) = 0;

  virtual std::optional<model::ChunkRecord> GetChunk(Transaction&, uint64_t id) = 0;

  virtual std::optional<model::ChunkRecord> FindChunk(Transaction&, const std::string& mid, const std::string& kind) = 0;

  // Ordered by id.
  virtual std::vector<model::ChunkRecord> ListChunksByMid(Transaction&, const std::string& mid) = 0;

  // Ordered by id.
  virtual std::vector<model::ChunkRecord> ListChunksByKind(Transaction&, const std::string& kind, const Page& page) = 0;

  std::vector<model::ChunkRecord> ListChunksByKind(Transaction& t, const std::string& kind) {
    return ListChunksByKind(t, kind, Page{});
  }

  virtual Result UpdateChunkPayload(Transaction&, uint64_t id, const std::string& payload, const std::string& method) = 0;

  // Removes the chunk and its header rows. NotFound if absent.
  virtual Result DeleteChunk(Transaction&, uint64_t id) = 0;

  // Removes every chunk of mid and their header rows; returns count in *deleted.
  virtual Result DeleteChunksByMid(Transaction&, const std::string& mid, uint64_t* deleted) = 0;

  virtual uint64_t CountChunks(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Derived lookups
  // ---------------------------------------------------------------------

  // http_flow chunk ids whose method matches case-insensitively. Ordered by id.
  virtual std::vector<uint64_t> FindFlowIdsByMethod(Transaction&, const std::string& method) = 0;

  // Sum of payload lengths per mid over chunks whose kind is in kinds.
  // Mids without any such chunk are absent.
  virtual std::unordered_map<std::string, ContentSize> ContentSizes(Transaction&, const std::vector<std::string>& kinds) = 0;

  // ---------------------------------------------------------------------
  // Materialized headers
  // ---------------------------------------------------------------------

  virtual Result ReplaceHeaders(Transaction&, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows) = 0;

  // Ordered by (chunk_id, direction, position).
  virtual std::vector<model::HeaderRecord> ListHeaders(Transaction&, const HeaderQuery& query) = 0;
};

} // namespace flowstore::db
