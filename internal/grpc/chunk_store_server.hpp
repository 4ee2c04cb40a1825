#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "flowstore/services/v1/chunk_store_service.grpc.pb.h"
#include "internal/service/chunk_service.hpp"

namespace flowstore::grpc {

class ChunkStoreServer final : public flowstore::services::v1::ChunkStoreService::Service {
public:
  explicit ChunkStoreServer(std::shared_ptr<flowstore::service::ChunkService> svc);

  ::grpc::Status InsertChunks(::grpc::ServerContext*,
                              const flowstore::services::v1::InsertChunksRequest*,
                              flowstore::services::v1::InsertChunksResponse*) override;

  ::grpc::Status ReplaceChunk(::grpc::ServerContext*,
                              const flowstore::services::v1::ReplaceChunkRequest*,
                              flowstore::services::v1::ReplaceChunkResponse*) override;

  ::grpc::Status UpdatePayload(::grpc::ServerContext*,
                               const flowstore::services::v1::UpdatePayloadRequest*,
                               flowstore::services::v1::UpdatePayloadResponse*) override;

  ::grpc::Status GetChunk(::grpc::ServerContext*,
                          const flowstore::services::v1::GetChunkRequest*,
                          flowstore::services::v1::GetChunkResponse*) override;

  ::grpc::Status ListChunks(::grpc::ServerContext*,
                            const flowstore::services::v1::ListChunksRequest*,
                            flowstore::services::v1::ListChunksResponse*) override;

  ::grpc::Status DeleteChunk(::grpc::ServerContext*,
                             const flowstore::services::v1::DeleteChunkRequest*,
                             flowstore::services::v1::DeleteChunkResponse*) override;

  ::grpc::Status DeleteMessage(::grpc::ServerContext*,
                               const flowstore::services::v1::DeleteMessageRequest*,
                               flowstore::services::v1::DeleteMessageResponse*) override;

private:
  std::shared_ptr<flowstore::service::ChunkService> service_;
};

}
