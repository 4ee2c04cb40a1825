#pragma once

#include "flowstore/services/v1/chunk_store_service.pb.h"
#include "service_context.hpp"

namespace flowstore::service {

class ChunkService {
public:
  explicit ChunkService(ServiceContext ctx);

  flowstore::services::v1::InsertChunksResponse
  InsertChunks(const flowstore::services::v1::InsertChunksRequest& req);

  flowstore::services::v1::ReplaceChunkResponse
  ReplaceChunk(const flowstore::services::v1::ReplaceChunkRequest& req);

  flowstore::services::v1::UpdatePayloadResponse
  UpdatePayload(const flowstore::services::v1::UpdatePayloadRequest& req);

  flowstore::services::v1::GetChunkResponse
  GetChunk(const flowstore::services::v1::GetChunkRequest& req);

  flowstore::services::v1::ListChunksResponse
  ListChunks(const flowstore::services::v1::ListChunksRequest& req);

  void DeleteChunk(const flowstore::services::v1::DeleteChunkRequest& req);

  flowstore::services::v1::DeleteMessageResponse
  DeleteMessage(const flowstore::services::v1::DeleteMessageRequest& req);

private:
  ServiceContext ctx_;
};

}
