#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "flowstore/services/v1/flow_query_service.grpc.pb.h"
#include "internal/service/query_service.hpp"

namespace flowstore::grpc {

class FlowQueryServer final : public flowstore::services::v1::FlowQueryService::Service {
public:
  explicit FlowQueryServer(std::shared_ptr<flowstore::service::QueryService> svc);

  ::grpc::Status ListFlows(::grpc::ServerContext*,
                           const flowstore::services::v1::ListFlowsRequest*,
                           flowstore::services::v1::ListFlowsResponse*) override;

  ::grpc::Status SearchHeaders(::grpc::ServerContext*,
                               const flowstore::services::v1::SearchHeadersRequest*,
                               flowstore::services::v1::SearchHeadersResponse*) override;

private:
  std::shared_ptr<flowstore::service::QueryService> service_;
};

}
