#include "flow_query_server.hpp"
#include "grpc_error.hpp"

namespace flowstore::grpc {

using namespace flowstore::services::v1;

FlowQueryServer::FlowQueryServer(std::shared_ptr<flowstore::service::QueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status FlowQueryServer::ListFlows(::grpc::ServerContext*,
                                      const ListFlowsRequest* req,
                                      ListFlowsResponse* resp) {
  try {
    *resp = service_->ListFlows(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status FlowQueryServer::SearchHeaders(::grpc::ServerContext*,
                                      const SearchHeadersRequest* req,
                                      SearchHeadersResponse* resp) {
  try {
    *resp = service_->SearchHeaders(*req);
    return ::grpc::Status::OK;
  } catch (const flowstore::util::InvariantViolation& e) {
    TerminateOnInvariant(e);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
