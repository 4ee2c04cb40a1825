#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace flowstore::db { class Repository; }
namespace flowstore::core { class ChunkStore; }
namespace flowstore::projection { class FlowTable; class HeaderTable; }
namespace flowstore::service { class ChunkService; class QueryService; }

namespace flowstore::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>         repository;
  std::shared_ptr<core::ChunkStore>       store;
  std::shared_ptr<projection::FlowTable>  flows;
  std::shared_ptr<projection::HeaderTable> headers;

  std::shared_ptr<service::ChunkService> chunk_service;
  std::shared_ptr<service::QueryService> query_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend from the runtime config: opens and
  bootstraps the database, backfills derived tables, wires services and
  their gRPC adapters.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const flowstore::runtime::config::RuntimeConfig& config);

}
