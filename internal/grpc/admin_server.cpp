#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace reservation::grpc {

AdminServer::AdminServer(std::shared_ptr<reservation::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::BlockDate(::grpc::ServerContext* ctx, const reservation::engine::v1::BlockDateRequest* req,
                                      reservation::engine::v1::BlockDateResponse* resp) {
  try {
    *resp = service_->BlockDate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::UnblockDate(::grpc::ServerContext* ctx, const reservation::engine::v1::UnblockDateRequest* req,
                                        google::protobuf::Empty*) {
  try {
    service_->UnblockDate(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::ListBlockedDates(::grpc::ServerContext* ctx, const reservation::engine::v1::ListBlockedDatesRequest* req,
                                             reservation::engine::v1::ListBlockedDatesResponse* resp) {
  try {
    *resp = service_->ListBlockedDates(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::TodayReservations(::grpc::ServerContext* ctx, const reservation::engine::v1::TodayReservationsRequest* req,
                                              reservation::engine::v1::TodayReservationsResponse* resp) {
  try {
    *resp = service_->TodayReservations(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::DailyStats(::grpc::ServerContext* ctx, const reservation::engine::v1::DailyStatsRequest* req,
                                       reservation::engine::v1::DailyStatsResponse* resp) {
  try {
    *resp = service_->DailyStats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::GetSettings(::grpc::ServerContext* ctx, const reservation::engine::v1::GetSettingsRequest* req,
                                        reservation::engine::v1::GetSettingsResponse* resp) {
  try {
    *resp = service_->GetSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status AdminServer::UpdateSettings(::grpc::ServerContext* ctx, const reservation::engine::v1::UpdateSettingsRequest* req,
                                           reservation::engine::v1::UpdateSettingsResponse* resp) {
  try {
    *resp = service_->UpdateSettings(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace reservation::grpc
