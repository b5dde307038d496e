#include "reservation_server.hpp"

#include "grpc_error.hpp"

namespace reservation::grpc {

ReservationServer::ReservationServer(std::shared_ptr<reservation::service::ReservationService> svc) : service_(std::move(svc)) {
}

::grpc::Status ReservationServer::CreateReservation(::grpc::ServerContext* ctx, const reservation::engine::v1::CreateReservationRequest* req,
                                                    reservation::engine::v1::CreateReservationResponse* resp) {
  try {
    *resp = service_->Create(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ReservationServer::GetReservation(::grpc::ServerContext* ctx, const reservation::engine::v1::GetReservationRequest* req,
                                                 reservation::engine::v1::GetReservationResponse* resp) {
  try {
    *resp = service_->Get(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ReservationServer::CancelReservation(::grpc::ServerContext* ctx, const reservation::engine::v1::CancelReservationRequest* req,
                                                    reservation::engine::v1::CancelReservationResponse* resp) {
  try {
    *resp = service_->Cancel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ReservationServer::UpdateReservationStatus(::grpc::ServerContext* ctx, const reservation::engine::v1::UpdateReservationStatusRequest* req,
                                                          reservation::engine::v1::UpdateReservationStatusResponse* resp) {
  try {
    *resp = service_->UpdateStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ReservationServer::ListReservations(::grpc::ServerContext* ctx, const reservation::engine::v1::ListReservationsRequest* req,
                                                   reservation::engine::v1::ListReservationsResponse* resp) {
  try {
    *resp = service_->List(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

::grpc::Status ReservationServer::DeleteReservation(::grpc::ServerContext* ctx, const reservation::engine::v1::DeleteReservationRequest* req,
                                                    google::protobuf::Empty*) {
  try {
    service_->Delete(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e, ctx);
  }
}

} // namespace reservation::grpc
