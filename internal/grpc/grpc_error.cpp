#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace reservation::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  return ToStatus(e, nullptr);
}

::grpc::Status ToStatus(const std::exception& e, ::grpc::ServerContext* context) {
  using namespace reservation::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (const auto* exhausted = dynamic_cast<const CapacityExhausted*>(&e)) {
    if (context) {
      context->AddTrailingMetadata("remaining-capacity", std::to_string(exhausted->Remaining()));
    }
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (const auto* precondition = dynamic_cast<const PreconditionFailed*>(&e)) {
    if (context) {
      context->AddTrailingMetadata("required-hours", std::to_string(precondition->RequiredHours()));
      context->AddTrailingMetadata("actual-hours", std::to_string(precondition->ActualHours()));
    }
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const TransientConflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace reservation::grpc
