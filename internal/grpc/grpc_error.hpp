#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace reservation::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  CapacityExhausted and PreconditionFailed attach their numbers as
  trailing metadata ("remaining-capacity", "required-hours",
  "actual-hours") when a ServerContext is supplied.
*/

::grpc::Status ToStatus(const std::exception& e);
::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* context);

} // namespace reservation::grpc
