#include "factory.hpp"

#include <memory>
#include <string>
#include <vector>

#include "internal/core/chunk_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#include "internal/grpc/chunk_store_server.hpp"
#include "internal/grpc/flow_query_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/flow_table.hpp"
#include "internal/projection/header_table.hpp"
#include "internal/service/chunk_service.hpp"
#include "internal/service/query_service.hpp"
#include "internal/service/service_context.hpp"

namespace flowstore::factory {

using namespace flowstore;

namespace {

constexpr std::size_t kDefaultReaderConnections = 4;

struct BuiltRepository {
  std::shared_ptr<db::Repository> repository;
  // derived tables were created empty and need a backfill
  bool backfill_headers = false;
};

BuiltRepository BuildRepository(const flowstore::runtime::config::RuntimeConfig& config, const core::ChunkStoreOptions& options) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());

    db::sqlite::SchemaOptions schema;
    schema.multi_valued_kinds  = options.multi_valued_kinds;
    schema.materialize_headers = options.materialize_headers;
    auto state                 = db::sqlite::BootstrapSchema(*sqlite_db, schema);

    std::shared_ptr<db::sqlite::SqliteReaderPool> readers;
    if (!sqlite_db->IsPrivate()) {
      const auto connections = database.sqlite().reader_connections() == 0 ? kDefaultReaderConnections
                                                                           : static_cast<std::size_t>(database.sqlite().reader_connections());
      readers = std::make_shared<db::sqlite::SqliteReaderPool>(database.sqlite().path(), connections);
    }

    FLOWSTORE_LOG_INFO("sqlite backend ready", {observability::StringField("path", database.sqlite().path()),
                                                observability::BoolField("reader_pool", readers != nullptr)});
    return {std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db), std::move(readers)), state.header_table_created};
  }

  FLOWSTORE_LOG_INFO("memory backend ready");
  return {std::make_shared<db::memory::MemoryRepository>(options.multi_valued_kinds), false};
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const flowstore::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  core::ChunkStoreOptions options;
  const auto&             chunk_store = config.chunk_store();
  options.multi_valued_kinds.assign(chunk_store.multi_valued_kinds().begin(), chunk_store.multi_valued_kinds().end());
  options.materialize_headers = chunk_store.has_materialize_headers() ? chunk_store.materialize_headers() : true;

  auto built     = BuildRepository(config, options);
  app.repository = built.repository;
  app.store      = std::make_shared<core::ChunkStore>(app.repository, options);

  if (built.backfill_headers) {
    app.store->RebuildHeaders();
  }

  // ------------------------------------------------------------------
  // Projections
  // ------------------------------------------------------------------
  app.flows   = std::make_shared<projection::FlowTable>(app.repository);
  app.headers = std::make_shared<projection::HeaderTable>(app.repository, options.materialize_headers);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store   = app.store;
  ctx.flows   = app.flows;
  ctx.headers = app.headers;

  app.chunk_service = std::make_shared<service::ChunkService>(ctx);
  app.query_service = std::make_shared<service::QueryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ChunkStoreServer>(app.chunk_service));
  app.grpc_services.push_back(std::make_unique<grpc::FlowQueryServer>(app.query_service));

  return app;
}

} // namespace flowstore::factory
