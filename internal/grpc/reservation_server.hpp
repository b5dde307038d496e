#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "reservation/engine/v1/reservation_service.grpc.pb.h"
#include "internal/service/reservation_service.hpp"

namespace reservation::grpc {

class ReservationServer final : public reservation::engine::v1::ReservationService::Service {
public:
  explicit ReservationServer(std::shared_ptr<reservation::service::ReservationService> svc);

  ::grpc::Status CreateReservation(::grpc::ServerContext*,
                                   const reservation::engine::v1::CreateReservationRequest*,
                                   reservation::engine::v1::CreateReservationResponse*) override;

  ::grpc::Status GetReservation(::grpc::ServerContext*,
                                const reservation::engine::v1::GetReservationRequest*,
                                reservation::engine::v1::GetReservationResponse*) override;

  ::grpc::Status CancelReservation(::grpc::ServerContext*,
                                   const reservation::engine::v1::CancelReservationRequest*,
                                   reservation::engine::v1::CancelReservationResponse*) override;

  ::grpc::Status UpdateReservationStatus(::grpc::ServerContext*,
                                         const reservation::engine::v1::UpdateReservationStatusRequest*,
                                         reservation::engine::v1::UpdateReservationStatusResponse*) override;

  ::grpc::Status ListReservations(::grpc::ServerContext*,
                                  const reservation::engine::v1::ListReservationsRequest*,
                                  reservation::engine::v1::ListReservationsResponse*) override;

  ::grpc::Status DeleteReservation(::grpc::ServerContext*,
                                   const reservation::engine::v1::DeleteReservationRequest*,
                                   google::protobuf::Empty*) override;

private:
  std::shared_ptr<reservation::service::ReservationService> service_;
};

}
