#pragma once

#include "flowstore/store/v1/chunk.pb.h"

#include "flowstore/services/v1/chunk_store_service.pb.h"
#include "flowstore/services/v1/flow_query_service.pb.h"

#include "flowstore/services/v1/chunk_store_service.grpc.pb.h"
#include "flowstore/services/v1/flow_query_service.grpc.pb.h"

namespace flowstore::store::v1 {
using namespace ::flowstore::services::v1;
}
