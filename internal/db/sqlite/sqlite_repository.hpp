#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace flowstore::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  // readers may be null; reads then share the writer connection
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db, std::shared_ptr<SqliteReaderPool> readers = nullptr);

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
  std::shared_ptr<SqliteDB>         db_;
  std::shared_ptr<SqliteReaderPool> readers_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  static Result WriteHeaders(sqlite3* db, uint64_t chunk_id, const std::vector<model::HeaderRecord>& rows);
};

}
