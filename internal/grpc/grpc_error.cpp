#include "grpc_error.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace flowstore::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace flowstore::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  // DuplicateChunk before its base
  if (dynamic_cast<const DuplicateChunk*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const ConstraintViolation*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void TerminateOnInvariant(const util::InvariantViolation& e) {
  FLOWSTORE_LOG_ERROR("invariant violated, terminating", {observability::StringField("error", e.what())});
  std::terminate();
}

} // namespace flowstore::grpc
