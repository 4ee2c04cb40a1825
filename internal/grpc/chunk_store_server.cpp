#include "chunk_store_server.hpp"
#include "grpc_error.hpp"

namespace flowstore::grpc {

using namespace flowstore::services::v1;

/*
  util::InvariantViolation is not a request error: it terminates the
  process instead of becoming a status.
*/

ChunkStoreServer::ChunkStoreServer(std::shared_ptr<flowstore::service::ChunkService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ChunkStoreServer::InsertChunks(::grpc::ServerContext*,
                                       const InsertChunksRequest* req,
                                       InsertChunksResponse* resp) {
  try {
    *resp = service_->InsertChunks(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::ReplaceChunk(::grpc::ServerContext*,
                                       const ReplaceChunkRequest* req,
                                       ReplaceChunkResponse* resp) {
  try {
    *resp = service_->ReplaceChunk(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::UpdatePayload(::grpc::ServerContext*,
                                       const UpdatePayloadRequest* req,
                                       UpdatePayloadResponse* resp) {
  try {
    *resp = service_->UpdatePayload(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::GetChunk(::grpc::ServerContext*,
                                       const GetChunkRequest* req,
                                       GetChunkResponse* resp) {
  try {
    *resp = service_->GetChunk(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::ListChunks(::grpc::ServerContext*,
                                       const ListChunksRequest* req,
                                       ListChunksResponse* resp) {
  try {
    *resp = service_->ListChunks(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::DeleteChunk(::grpc::ServerContext*,
                                       const DeleteChunkRequest* req,
                                       DeleteChunkResponse*) {
  try {
    service_->DeleteChunk(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ChunkStoreServer::DeleteMessage(::grpc::ServerContext*,
                                       const DeleteMessageRequest* req,
                                       DeleteMessageResponse* resp) {
  try {
    *resp = service_->DeleteMessage(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
