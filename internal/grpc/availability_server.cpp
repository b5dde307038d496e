#include "availability_server.hpp"

#include "grpc_error.hpp"

namespace reservation::grpc {

AvailabilityServer::AvailabilityServer(std::shared_ptr<reservation::service::AvailabilityService> svc) : service_(std::move(svc)) {
}

::grpc::Status AvailabilityServer::GetSlotAvailability(::grpc::ServerContext* ctx, const reservation::engine::v1::SlotAvailabilityRequest* req,
                                                       reservation::engine::v1::SlotAvailabilityResponse* resp) {
  try {
    *resp = service_->GetSlotAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AvailabilityServer::GetDailyAvailability(::grpc::ServerContext* ctx, const reservation::engine::v1::DailyAvailabilityRequest* req,
                                                        reservation::engine::v1::DailyAvailabilityResponse* resp) {
  try {
    *resp = service_->GetDailyAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AvailabilityServer::ListAvailableSlots(::grpc::ServerContext* ctx, const reservation::engine::v1::AvailableSlotsRequest* req,
                                                      reservation::engine::v1::AvailableSlotsResponse* resp) {
  try {
    *resp = service_->ListAvailableSlots(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AvailabilityServer::HasAvailability(::grpc::ServerContext* ctx, const reservation::engine::v1::HasAvailabilityRequest* req,
                                                   reservation::engine::v1::HasAvailabilityResponse* resp) {
  try {
    *resp = service_->HasAvailability(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace reservation::grpc
