#pragma once

#include <memory>

namespace flowstore::core { class ChunkStore; }
namespace flowstore::projection { class FlowTable; class HeaderTable; }

namespace flowstore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<flowstore::core::ChunkStore>        store;
  std::shared_ptr<flowstore::projection::FlowTable>   flows;
  std::shared_ptr<flowstore::projection::HeaderTable> headers;
};

}
