#include "chunk_store.hpp"

#include "internal/codec/flow_payload.hpp"
#include "internal/codec/kinds.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::core {

namespace {

void ValidateKey(const std::string& mid, const std::string& kind) {
  if (mid.empty()) {
    throw util::InvalidArgument("mid must not be empty");
  }
  if (kind.empty()) {
    throw util::InvalidArgument("kind must not be empty");
  }
}

} // namespace

ChunkStore::ChunkStore(std::shared_ptr<db::Repository> repository, ChunkStoreOptions options)
    : repository_(std::move(repository)),
      options_(std::move(options)),
      guard_(options_.multi_valued_kinds),
      sequencer_(*repository_) {
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

db::model::ChunkRecord ChunkStore::InsertInTx(db::Transaction& tx, const NewChunk& chunk) {
  ValidateKey(chunk.mid, chunk.kind);
  guard_.Check(*repository_, tx, chunk.mid, chunk.kind);

  db::model::ChunkRecord record;
  record.mid     = chunk.mid;
  record.kind    = chunk.kind;
  record.payload = chunk.payload;
  record.method  = codec::DeriveMethod(chunk.kind, chunk.payload);
  record.seq     = sequencer_.Assign(tx, chunk.mid);

  auto result = repository_->InsertChunk(tx, record);
  if (result.code == db::ErrorCode::ConstraintViolation && !guard_.IsExempt(chunk.kind)) {
    // the unique index saw a writer the guard did not
    throw util::DuplicateChunk(chunk.mid, chunk.kind);
  }
  ThrowIfDbError(result, "insert chunk");

  WriteHeaders(tx, record);
  return record;
}

void ChunkStore::WriteHeaders(db::Transaction& tx, const db::model::ChunkRecord& chunk) {
  if (!options_.materialize_headers || chunk.kind != codec::kHttpFlow) {
    return;
  }

  std::vector<db::model::HeaderRecord> rows;
  try {
    rows = codec::HeaderRows(chunk);
  } catch (const util::MalformedPayload& e) {
    FLOWSTORE_LOG_WARN("http_flow payload has no readable headers",
                       {observability::UintField("chunk_id", chunk.id), observability::StringField("error", e.what())});
  }
  ThrowIfDbError(repository_->ReplaceHeaders(tx, chunk.id, rows), "write header rows");
}

db::model::ChunkRecord ChunkStore::Insert(const std::string& mid, const std::string& kind, const std::string& payload) {
  std::scoped_lock lock(write_mutex_);

  auto tx     = repository_->Begin(db::TxMode::kWrite);
  auto record = InsertInTx(*tx, NewChunk{mid, kind, payload});
  tx->Commit();

  FLOWSTORE_LOG_DEBUG("chunk inserted", {observability::UintField("id", record.id), observability::StringField("mid", record.mid),
                                         observability::StringField("kind", record.kind), observability::UintField("seq", record.seq)});
  return record;
}

std::vector<db::model::ChunkRecord> ChunkStore::InsertBatch(const std::vector<NewChunk>& chunks) {
  std::vector<db::model::ChunkRecord> out;
  if (chunks.empty()) {
    return out;
  }
  out.reserve(chunks.size());

  std::scoped_lock lock(write_mutex_);

  auto tx = repository_->Begin(db::TxMode::kWrite);
  for (const auto& chunk : chunks) {
    out.push_back(InsertInTx(*tx, chunk));
  }
  tx->Commit();

  FLOWSTORE_LOG_DEBUG("chunk batch inserted", {observability::UintField("count", out.size())});
  return out;
}

ReplaceResult ChunkStore::Replace(const std::string& mid, const std::string& kind, const std::string& payload) {
  ValidateKey(mid, kind);

  std::scoped_lock lock(write_mutex_);

  ReplaceResult result;
  auto          tx = repository_->Begin(db::TxMode::kWrite);

  if (!guard_.IsExempt(kind)) {
    if (auto existing = repository_->FindChunk(*tx, mid, kind)) {
      ThrowIfDbError(repository_->DeleteChunk(*tx, existing->id), "delete replaced chunk");
      result.replaced_id = existing->id;
    }
  }

  result.chunk = InsertInTx(*tx, NewChunk{mid, kind, payload});
  tx->Commit();

  if (result.replaced_id) {
    FLOWSTORE_LOG_DEBUG("chunk replaced", {observability::UintField("old_id", *result.replaced_id),
                                           observability::UintField("id", result.chunk.id), observability::StringField("mid", mid),
                                           observability::StringField("kind", kind)});
  }
  return result;
}

db::model::ChunkRecord ChunkStore::UpdatePayload(uint64_t id, const std::string& payload) {
  std::scoped_lock lock(write_mutex_);

  auto tx     = repository_->Begin(db::TxMode::kWrite);
  auto record = repository_->GetChunk(*tx, id);
  if (!record) {
    throw util::NotFound("chunk " + std::to_string(id));
  }

  record->payload = payload;
  record->method  = codec::DeriveMethod(record->kind, payload);
  ThrowIfDbError(repository_->UpdateChunkPayload(*tx, id, record->payload, record->method), "update payload");
  WriteHeaders(*tx, *record);
  tx->Commit();

  return *record;
}

void ChunkStore::Delete(uint64_t id) {
  std::scoped_lock lock(write_mutex_);

  auto tx = repository_->Begin(db::TxMode::kWrite);
  ThrowIfDbError(repository_->DeleteChunk(*tx, id), "delete chunk " + std::to_string(id));
  tx->Commit();
}

uint64_t ChunkStore::DeleteMessage(const std::string& mid) {
  if (mid.empty()) {
    throw util::InvalidArgument("mid must not be empty");
  }

  std::scoped_lock lock(write_mutex_);

  uint64_t deleted = 0;
  auto     tx      = repository_->Begin(db::TxMode::kWrite);
  ThrowIfDbError(repository_->DeleteChunksByMid(*tx, mid, &deleted), "delete message " + mid);
  tx->Commit();

  FLOWSTORE_LOG_DEBUG("message deleted", {observability::StringField("mid", mid), observability::UintField("chunks", deleted)});
  return deleted;
}

uint64_t ChunkStore::RebuildHeaders() {
  if (!options_.materialize_headers) {
    return 0;
  }

  std::scoped_lock lock(write_mutex_);

  auto     tx    = repository_->Begin(db::TxMode::kWrite);
  auto     flows = repository_->ListChunksByKind(*tx, codec::kHttpFlow);
  for (const auto& flow : flows) {
    WriteHeaders(*tx, flow);
  }
  tx->Commit();

  FLOWSTORE_LOG_INFO("header rows rebuilt", {observability::UintField("flows", flows.size())});
  return flows.size();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<db::model::ChunkRecord> ChunkStore::GetById(uint64_t id) {
  auto tx     = repository_->Begin(db::TxMode::kRead);
  auto record = repository_->GetChunk(*tx, id);
  tx->Commit();
  return record;
}

std::vector<db::model::ChunkRecord> ChunkStore::ListByMid(const std::string& mid) {
  auto tx      = repository_->Begin(db::TxMode::kRead);
  auto records = repository_->ListChunksByMid(*tx, mid);
  tx->Commit();
  return records;
}

std::vector<db::model::ChunkRecord> ChunkStore::ListByKind(const std::string& kind, const db::Page& page) {
  auto tx      = repository_->Begin(db::TxMode::kRead);
  auto records = repository_->ListChunksByKind(*tx, kind, page);
  tx->Commit();
  return records;
}

} // namespace flowstore::core
