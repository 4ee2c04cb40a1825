#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace flowstore::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

// Logs the broken invariant and terminates the process. gRPC turns a
// handler exception into UNKNOWN, so handlers call this instead of
// rethrowing.
[[noreturn]] void TerminateOnInvariant(const util::InvariantViolation& e);

} // namespace flowstore::grpc
