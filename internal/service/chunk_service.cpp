#include "chunk_service.hpp"

#include <string>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/service/observe.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::service {

using namespace flowstore::services::v1;

namespace {

void ToProto(const db::model::ChunkRecord& record, flowstore::store::v1::Chunk* out) {
  out->set_id(record.id);
  out->set_mid(record.mid);
  out->set_kind(record.kind);
  out->set_seq(record.seq);
  out->set_payload(record.payload);
  out->set_method(record.method);
}

core::NewChunk FromProto(const flowstore::store::v1::NewChunk& chunk) {
  return core::NewChunk{chunk.mid(), chunk.kind(), chunk.payload()};
}

void RequireId(uint64_t id) {
  if (id == 0) {
    throw util::InvalidArgument("chunk id is required");
  }
}

} // namespace

ChunkService::ChunkService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

InsertChunksResponse ChunkService::InsertChunks(const InsertChunksRequest& req) {
  return ObserveRpc("ChunkStoreService.InsertChunks", [&] {
    if (req.chunks_size() == 0) {
      throw util::InvalidArgument("insert chunks: at least one chunk is required");
    }

    std::vector<core::NewChunk> batch;
    batch.reserve(req.chunks_size());
    for (const auto& chunk : req.chunks()) {
      batch.push_back(FromProto(chunk));
    }

    InsertChunksResponse resp;
    for (const auto& record : ctx_.store->InsertBatch(batch)) {
      ToProto(record, resp.add_chunks());
    }
    return resp;
  });
}

ReplaceChunkResponse ChunkService::ReplaceChunk(const ReplaceChunkRequest& req) {
  return ObserveRpc("ChunkStoreService.ReplaceChunk", [&] {
    if (!req.has_chunk()) {
      throw util::InvalidArgument("replace chunk: chunk is required");
    }

    auto result = ctx_.store->Replace(req.chunk().mid(), req.chunk().kind(), req.chunk().payload());

    ReplaceChunkResponse resp;
    ToProto(result.chunk, resp.mutable_chunk());
    if (result.replaced_id) {
      resp.set_replaced_id(*result.replaced_id);
    }
    return resp;
  });
}

UpdatePayloadResponse ChunkService::UpdatePayload(const UpdatePayloadRequest& req) {
  return ObserveRpc("ChunkStoreService.UpdatePayload", [&] {
    RequireId(req.id());

    UpdatePayloadResponse resp;
    ToProto(ctx_.store->UpdatePayload(req.id(), req.payload()), resp.mutable_chunk());
    return resp;
  });
}

GetChunkResponse ChunkService::GetChunk(const GetChunkRequest& req) {
  return ObserveRpc("ChunkStoreService.GetChunk", [&] {
    RequireId(req.id());

    auto record = ctx_.store->GetById(req.id());
    if (!record) {
      throw util::NotFound("chunk " + std::to_string(req.id()));
    }

    GetChunkResponse resp;
    ToProto(*record, resp.mutable_chunk());
    return resp;
  });
}

ListChunksResponse ChunkService::ListChunks(const ListChunksRequest& req) {
  return ObserveRpc("ChunkStoreService.ListChunks", [&] {
    std::vector<db::model::ChunkRecord> records;
    switch (req.selector_case()) {
      case ListChunksRequest::kMid:
        records = ctx_.store->ListByMid(req.mid());
        break;
      case ListChunksRequest::kKind:
        records = ctx_.store->ListByKind(req.kind(), db::Page{.limit = static_cast<std::size_t>(req.limit()), .offset = static_cast<std::size_t>(req.offset())});
        break;
      default:
        throw util::InvalidArgument("list chunks: mid or kind is required");
    }

    ListChunksResponse resp;
    for (const auto& record : records) {
      ToProto(record, resp.add_chunks());
    }
    return resp;
  });
}

void ChunkService::DeleteChunk(const DeleteChunkRequest& req) {
  ObserveRpc("ChunkStoreService.DeleteChunk", [&] {
    RequireId(req.id());
    ctx_.store->Delete(req.id());
  });
}

DeleteMessageResponse ChunkService::DeleteMessage(const DeleteMessageRequest& req) {
  return ObserveRpc("ChunkStoreService.DeleteMessage", [&] {
    DeleteMessageResponse resp;
    resp.set_deleted(ctx_.store->DeleteMessage(req.mid()));
    return resp;
  });
}

} // namespace flowstore::service
