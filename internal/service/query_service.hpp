#pragma once

#include "flowstore/services/v1/flow_query_service.pb.h"
#include "service_context.hpp"

namespace flowstore::service {

class QueryService {
public:
  explicit QueryService(ServiceContext ctx);

  flowstore::services::v1::ListFlowsResponse
  ListFlows(const flowstore::services::v1::ListFlowsRequest& req);

  flowstore::services::v1::SearchHeadersResponse
  SearchHeaders(const flowstore::services::v1::SearchHeadersRequest& req);

private:
  ServiceContext ctx_;
};

}
